#include "egress/Gateway.h"
#include "egress/common/Config.h"
#include "egress/common/Logger.h"

#include <getopt.h>
#include <signal.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

void PrintUsage(const char* prog) {
    printf("Usage: %s [-c config_file] [-X method] [-H 'Name: value']... [-d body]\n", prog);
    printf("          [-t timeout_ms] [-T text|json|arrayBuffer|formData] [-v] URL\n");
    printf("  -v  debug logging\n");
}

void PrintBody(const egress::FetchResult& r) {
    using namespace egress;
    if (const auto* text = std::get_if<std::string>(&r.body)) {
        std::cout << *text;
        if (!text->empty() && text->back() != '\n') std::cout << "\n";
    } else if (const auto* bytes = std::get_if<Bytes>(&r.body)) {
        std::cout << "<" << bytes->size() << " bytes>\n";
    } else if (const auto* json = std::get_if<Json::Value>(&r.body)) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::cout << Json::writeString(builder, *json) << "\n";
    } else if (const auto* form = std::get_if<FormData>(&r.body)) {
        for (const auto& entry : *form) {
            if (const auto* file = std::get_if<FileBlob>(&entry.value)) {
                std::cout << entry.name << ": <file " << file->name << ", " << file->mimeType << ", "
                          << file->size() << " bytes>\n";
            } else {
                std::cout << entry.name << ": " << std::get<std::string>(entry.value) << "\n";
            }
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace egress;

    std::string configFile;
    FetchParams params;
    bool verbose = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:X:H:d:t:T:vh")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'X':
                params.method = optarg;
                break;
            case 'H': {
                const std::string h = optarg;
                const size_t colon = h.find(':');
                if (colon == std::string::npos) {
                    fprintf(stderr, "invalid header '%s'\n", optarg);
                    return 2;
                }
                SetHeader(&params.headers, common::Config::Trim(h.substr(0, colon)), common::Config::Trim(h.substr(colon + 1)));
                break;
            }
            case 'd':
                params.body = std::string(optarg);
                if (params.method.empty()) params.method = "POST";
                break;
            case 't': {
                char* end = nullptr;
                const long ms = std::strtol(optarg, &end, 10);
                if (end == optarg || *end != '\0' || ms < 0) {
                    fprintf(stderr, "invalid timeout '%s'\n", optarg);
                    return 2;
                }
                params.timeout = std::chrono::milliseconds(ms);
                break;
            }
            case 'T': {
                BodyType type;
                if (!ParseBodyType(optarg, &type)) {
                    fprintf(stderr, "invalid body type '%s'\n", optarg);
                    return 2;
                }
                params.type = type;
                break;
            }
            case 'v':
                verbose = true;
                break;
            case 'h':
            default:
                PrintUsage(argv[0]);
                return ch == 'h' ? 0 : 2;
        }
    }
    if (optind != argc - 1) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string url = argv[optind];

    // TLS writes on a reset connection must not kill the process.
    ::signal(SIGPIPE, SIG_IGN);

    common::Config conf;
    if (!configFile.empty() && !conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config " << configFile;
        return 2;
    }
    common::Logger::Instance().SetLevel(
        verbose ? common::LogLevel::DEBUG : common::Logger::ParseLevel(conf.GetString("global", "log_level", "WARN")));

    GatewayOptions options;
    std::string error;
    if (!LoadGatewayOptions(conf, &options, &error)) {
        LOG_ERROR << "Invalid config: " << error;
        return 2;
    }

    try {
        Gateway gateway(std::move(options));
        const FetchResult r = gateway.Fetch(url, params);
        std::cout << r.status << " " << r.statusText << "\n";
        for (const auto& kv : r.headers) std::cout << kv.first << ": " << kv.second << "\n";
        std::cout << "\n";
        PrintBody(r);
        return 0;
    } catch (const FetchError& e) {
        fprintf(stderr, "fetch failed [%s]: %s\n", FetchError::KindName(e.kind()), e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        fprintf(stderr, "invalid configuration: %s\n", e.what());
        return 2;
    }
}
