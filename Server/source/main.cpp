#include <cstdlib>
#include <memory>
#include <variant>
#include <string>
#include <vector>
#include <map>

#include <getopt.h>

#include <grpcpp/support/server_interceptor.h>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "ChunkedUploadServiceImpl.hpp"
#include "FileSessionStore.hpp"
#include "MemoryAppendBlobService.hpp"
#include "MemorySessionStore.hpp"
#include "ServerInterceptor.hpp"
#include "SessionReaper.hpp"
#include "UploadPolicy.hpp"

using ArgList = std::map<std::string, std::string>;

std::pair<bool, std::variant<ArgList, std::string>> ParseArgument(int argc, char* argv[])
{
    ArgList arglist;

    const struct option options[] = {
            { "loglevel",          required_argument, nullptr, 'l' },
            { "root-dir",          required_argument, nullptr, 'r' },
            { "metadata-dir",      required_argument, nullptr, 'm' },
            { "storage",           required_argument, nullptr, 's' },
            { "max-bytes",         required_argument, nullptr, 'b' },
            { "expiration",        required_argument, nullptr, 'e' },
            { "reap-interval",     required_argument, nullptr, 'i' },
            { "fail-if-no-header", no_argument,       nullptr, 'H' },
            { "no-checksum",       no_argument,       nullptr, 'C' },
            { "require-auth",      no_argument,       nullptr, 'A' },
            { nullptr, 0, nullptr, 0 }
    };

    try {
        int optidx;
        for (int opt; (opt = getopt_long(argc, argv, "l:r:m:s:b:e:i:HCA", options, &optidx)) != -1; ) {
            switch (opt) {
            case 'l': arglist["loglevel"] = optarg; break;
            case 'r': arglist["root-dir"] = optarg; break;
            case 'm': arglist["metadata-dir"] = optarg; break;
            case 's': arglist["storage"] = optarg; break;
            case 'b': arglist["max-bytes"] = optarg; break;
            case 'e': arglist["expiration"] = optarg; break;
            case 'i': arglist["reap-interval"] = optarg; break;
            case 'H': arglist["fail-if-no-header"] = "true"; break;
            case 'C': arglist["no-checksum"] = "true"; break;
            case 'A': arglist["require-auth"] = "true"; break;
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
    if (argc < 2)
        return { false, fmt::format("usage: {} [--loglevel <level>] [--root-dir <directory>] [--metadata-dir <directory>] "
                                    "[--storage local|append-blob (in-memory, lost on exit)] [--max-bytes <n>] [--expiration <seconds>] "
                                    "[--reap-interval <seconds>] [--fail-if-no-header] [--no-checksum] [--require-auth] "
                                    "<host> <service>", program) };

    argv += optind;

    arglist["host"] = *argv++;
    arglist["service"] = *argv++;

    if (arglist.find("root-dir") == arglist.end())
        arglist["root-dir"] = ".";

    if (arglist.find("loglevel") == arglist.end())
        arglist["loglevel"] = "info";

    if (arglist.find("storage") == arglist.end())
        arglist["storage"] = "local";

    return { true, arglist };
}

std::pair<bool, std::variant<UploadPolicy, std::string>> MakePolicy(const ArgList& arglist)
{
    UploadPolicy policy;

    const auto backend = StorageBackendFromName(arglist.at("storage"));
    if (!backend)
        return { false, fmt::format("unknown storage backend: {}", arglist.at("storage")) };
    policy.storage_backend = *backend;

    if (auto it = arglist.find("max-bytes"); it != arglist.end()) {
        const auto max_bytes = ParseCount(it->second);
        if (!max_bytes || *max_bytes == 0)
            return { false, fmt::format("max-bytes must be a positive number: {}", it->second) };
        policy.max_bytes = *max_bytes;
    }

    if (auto it = arglist.find("expiration"); it != arglist.end()) {
        const auto expiration = ParseSeconds(it->second);
        if (!expiration || expiration->count() == 0)
            return { false, fmt::format("expiration must be a positive number of seconds: {}", it->second) };
        policy.expiration_window = *expiration;
    }

    policy.fail_if_no_header = arglist.count("fail-if-no-header") != 0;
    policy.verify_checksum = arglist.count("no-checksum") == 0;
    policy.require_authentication = arglist.count("require-auth") != 0;

    return { true, policy };
}

std::pair<bool, std::variant<std::shared_ptr<SessionStore>, std::string>> MakeStore(const ArgList& arglist)
{
    auto it = arglist.find("metadata-dir");
    if (it == arglist.end()) {
        spdlog::warn("no --metadata-dir given: upload sessions will not survive a restart");
        return { true, std::make_shared<MemorySessionStore>() };
    }

    auto store = std::make_shared<FileSessionStore>(it->second);
    if (!store->IsValid())
        return { false, fmt::format("invalid metadata directory {}", it->second) };

    return { true, std::shared_ptr<SessionStore>(std::move(store)) };
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

    auto logger = spdlog::stdout_color_mt("upload");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(arglist.at("loglevel")));

    ShowArgument(arglist);

    const auto &[policy_ok, policy_result] = MakePolicy(arglist);
    if (!policy_ok) {
        spdlog::error("failed to configure uploads: {}", std::get<std::string>(policy_result));
        return 1;
    }

    auto env = std::make_shared<UploadEnvironment>();
    env->policy = std::get<UploadPolicy>(policy_result);
    spdlog::info("upload policy: {}", env->policy.ToString());

    std::shared_ptr<AppendBlobService> blob_service;
    if (env->policy.storage_backend == StorageBackend::AppendBlob) {
        spdlog::warn("append-blob storage is backed by process memory");
        blob_service = std::make_shared<MemoryAppendBlobService>();
    }

    auto [sink_ok, sink, sink_error] = CreateBlobSink(env->policy, arglist.at("root-dir"), blob_service);
    if (!sink_ok) {
        spdlog::error("failed to create blob sink: {}", sink_error);
        return 1;
    }
    env->sink = std::move(sink);

    const auto &[store_ok, store_result] = MakeStore(arglist);
    if (!store_ok) {
        spdlog::error("failed to create session store: {}", std::get<std::string>(store_result));
        return 1;
    }
    env->store = std::get<std::shared_ptr<SessionStore>>(store_result);

    // 0 leaves the background sweep off
    std::chrono::seconds reap_interval(0);
    if (auto it = arglist.find("reap-interval"); it != arglist.end()) {
        const auto interval = ParseSeconds(it->second);
        if (!interval) {
            spdlog::error("reap-interval must be a number of seconds: {}", it->second);
            return 1;
        }
        reap_interval = *interval;
    }

    auto reaper = std::make_shared<SessionReaper>(env);

    ChunkedUploadServiceImpl service(env, reaper);
    spdlog::info("registered service(s): ChunkedUpload ({} storage)", env->sink->Name());

    std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> interceptors;
    interceptors.push_back(std::make_unique<ServerInterceptorFactory>(logger));

    grpc::ServerBuilder builder;
    builder.AddListeningPort(fmt::format("{}:{}", arglist.at("host"), arglist.at("service")), grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    builder.experimental().SetInterceptorCreators(std::move(interceptors));

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::error("failed to start server on {}:{}", arglist.at("host"), arglist.at("service"));
        return 1;
    }
    spdlog::info("server started: listening on {}:{}", arglist.at("host"), arglist.at("service"));

    reaper->Start(reap_interval);

    server->Wait();

    reaper->Stop();
    server->Shutdown();

    spdlog::info("server stopped");

    return 0;
}
