#include <map>
#include <variant>
#include <string>

#include <getopt.h>

#include <google/protobuf/util/time_util.h>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "ChunkedUploadClient.hpp"

using ArgList = std::map<std::string, std::string>;

std::pair<bool, std::variant<ArgList, std::string>> ParseArgument(int argc, char* argv[])
{
        ArgList arglist;

        const struct option options[] = {
                { "loglevel",    required_argument, nullptr, 'l' },
                { "chunk-size",  required_argument, nullptr, 'c' },
                { "principal",   required_argument, nullptr, 'p' },
                { "upload-id",   required_argument, nullptr, 'u' },
                { "no-checksum", no_argument,       nullptr, 'C' },
                { nullptr, 0, nullptr, 0 }
        };

        try {
                int optidx;
                for (int opt; (opt = getopt_long(argc, argv, "l:c:p:u:C", options, &optidx)) != -1; ) {
                        switch (opt) {
                        case 'l': arglist["loglevel"] = optarg; break;
                        case 'c': arglist["chunk-size"] = optarg; break;
                        case 'p': arglist["principal"] = optarg; break;
                        case 'u': arglist["upload-id"] = optarg; break;
                        case 'C': arglist["no-checksum"] = "true"; break;
                        case ':':
                                return { false, fmt::format("missing argument: {}", static_cast<char>(optopt)) };
                        case '?':
                                return { false, fmt::format("invalid argument: {}", static_cast<char>(optopt)) };
                        }
                }
        }
        catch (std::exception& e) {
                return { false, fmt::format("invalid argument: {}", e.what()) };
        }

        const char* program = *argv;

        argc -= optind;
        if (argc < 3)
                return { false, fmt::format("usage: {} [--loglevel <level>] [--chunk-size <bytes>] [--principal <name>] "
                                            "[--upload-id <id>] [--no-checksum] <host> <service> <infile>", program) };

        argv += optind;

        arglist["host"] = *argv++;
        arglist["service"] = *argv++;
        arglist["infile"] = *argv++;

        if (arglist.find("loglevel") == arglist.end())
                arglist["loglevel"] = "info";

        return { true, arglist };
}

std::pair<bool, std::variant<ChunkedUploadClient::Options, std::string>> MakeOptions(const ArgList& arglist)
{
        ChunkedUploadClient::Options options;

        try {
                if (auto it = arglist.find("chunk-size"); it != arglist.end())
                        options.chunk_size = std::stoull(it->second);
        }
        catch (std::exception& e) {
                return { false, fmt::format("invalid chunk size: {}", e.what()) };
        }

        if (options.chunk_size == 0)
                return { false, "chunk size must be positive" };

        if (auto it = arglist.find("principal"); it != arglist.end())
                options.principal = it->second;

        if (auto it = arglist.find("upload-id"); it != arglist.end())
                options.upload_id = it->second;

        options.send_checksum = arglist.count("no-checksum") == 0;

        return { true, options };
}

void ShowArgument(const ArgList& arglist)
{
	for (const auto &[name, value]: arglist)
	    spdlog::info("{}: {}", name, value);
}

int main(int argc, char* argv[])
{
	const auto &[success, result] = ParseArgument(argc, argv);
	if (!success) {
                spdlog::error("failed to ParseArgument(): {}", std::get<std::string>(result));
                return 1;
        }

        const ArgList& arglist = std::get<ArgList>(result);
        spdlog::set_level(spdlog::level::from_str(arglist.at("loglevel")));
        ShowArgument(arglist);

        const auto &[options_ok, options_result] = MakeOptions(arglist);
        if (!options_ok) {
                spdlog::error("failed to MakeOptions(): {}", std::get<std::string>(options_result));
                return 1;
        }

        const std::string target = fmt::format("{}:{}", arglist.at("host"), arglist.at("service"));
        std::shared_ptr<grpc::Channel> channel = grpc::CreateChannel(target, grpc::InsecureChannelCredentials());
        spdlog::info("channel opened at: {}", target);

        ChunkedUploadClient client(channel);

        const auto [uploaded, response, error] = client.UploadFile(arglist.at("infile"),
                                                                   std::get<ChunkedUploadClient::Options>(options_result));
        if (!uploaded) {
                spdlog::error("failed to upload file: {}", error.ToString());
                return 1;
        }

        using google::protobuf::util::TimeUtil;
        spdlog::info("file uploaded successfully: upload_id={} filename={} size={} completed={}",
                     response.receipt().upload_id(), response.filename(), response.size(),
                     TimeUtil::ToString(response.completed()));

        return 0;
}
