#include <cctype>
#include <chrono>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include <getopt.h>

#include <fmt/chrono.h>
#include <spdlog/spdlog.h>

#include "BatchUploader.hpp"
#include "CurlRemoteApi.hpp"
#include "TokenCache.hpp"
#include "UploadContext.hpp"
#include "UploadCoordinator.hpp"

using ArgList = std::map<std::string, std::string>;

namespace {
	constexpr const char* kUsage =
		"usage: {} [options] <file>\n"
		"       {} [options] --batch <source-dir> [--done-dir <dir>]\n"
		"options:\n"
		"  --corp-id <id>        identity id (env DRIVE_UPLOADER_CORP_ID)\n"
		"  --secret <secret>     identity secret (env DRIVE_UPLOADER_SECRET)\n"
		"  --space-id <id>       target space\n"
		"  --parent-id <id>      target folder (default: space root)\n"
		"  --token <token>       pre-seeded access token (debug)\n"
		"  --base-url <url>      API base url\n"
		"  --chunk-size <bytes>  block size (default 2097152)\n"
		"  --concurrency <n>     parallel part uploads (default 3)\n"
		"  --timeout <seconds>   overall deadline, 0 for none\n"
		"  --loglevel <level>    trace|debug|info|warn|error|off";

	std::optional<std::string> FromEnv(const char* name)
	{
		const char* value = std::getenv(name);
		if (value == nullptr || *value == '\0')
			return std::nullopt;

		return std::string(value);
	}

	std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& text)
	{
		if (!text.empty() && std::isdigit(static_cast<unsigned char>(text.front()))) {
			int level;
			try {
				level = std::stoi(text);
			}
			catch (const std::exception&) {
				return std::nullopt;
			}

			if (level < spdlog::level::trace || level > spdlog::level::off)
				return std::nullopt;

			return static_cast<spdlog::level::level_enum>(level);
		}

		const auto level = spdlog::level::from_str(text);
		if (level == spdlog::level::off && text != "off")
			return std::nullopt;

		return level;
	}

	std::string Mask(const std::string& name, const std::string& value)
	{
		if (name != "secret" && name != "token")
			return value;

		return value.size() <= 4 ? std::string("****") : value.substr(0, 4) + "****";
	}
}

std::pair<bool, std::variant<ArgList, std::string>> ParseArgument(int argc, char* argv[])
{
	ArgList arglist = {
		{ "chunk-size", std::to_string(BlockHasher::kDefaultBlockSize) },
		{ "concurrency", "3" },
		{ "timeout", "0" },
		{ "loglevel", "info" },
		{ "base-url", CurlRemoteApi::Options().base_url },
	};

	const struct option options[] = {
		{ "corp-id",	 required_argument, nullptr, 'c' },
		{ "secret",	 required_argument, nullptr, 's' },
		{ "space-id",	 required_argument, nullptr, 'S' },
		{ "parent-id",	 required_argument, nullptr, 'p' },
		{ "token",	 required_argument, nullptr, 't' },
		{ "base-url",	 required_argument, nullptr, 'u' },
		{ "chunk-size",	 required_argument, nullptr, 'b' },
		{ "concurrency", required_argument, nullptr, 'n' },
		{ "timeout",	 required_argument, nullptr, 'T' },
		{ "loglevel",	 required_argument, nullptr, 'l' },
		{ "batch",	 required_argument, nullptr, 'B' },
		{ "done-dir",	 required_argument, nullptr, 'd' },
		{ "help",	 no_argument,	    nullptr, 'h' },
		{ nullptr, 0, nullptr, 0 }
	};

	const std::string usage = fmt::format(kUsage, *argv, *argv);

	try {
		int optidx;
		for (int opt; (opt = getopt_long(argc, argv, ":h", options, &optidx)) != -1; ) {
			switch (opt) {
			case 'c': arglist["corp-id"] = optarg; break;
			case 's': arglist["secret"] = optarg; break;
			case 'S': arglist["space-id"] = optarg; break;
			case 'p': arglist["parent-id"] = optarg; break;
			case 't': arglist["token"] = optarg; break;
			case 'u': arglist["base-url"] = optarg; break;
			case 'b': arglist["chunk-size"] = std::to_string(std::stoull(optarg)); break;
			case 'n': arglist["concurrency"] = std::to_string(std::stoul(optarg)); break;
			case 'T': arglist["timeout"] = std::to_string(std::stoul(optarg)); break;
			case 'l': arglist["loglevel"] = optarg; break;
			case 'B': arglist["batch"] = optarg; break;
			case 'd': arglist["done-dir"] = optarg; break;
			case 'h':
				return { false, usage };
			case ':':
				return { false, fmt::format("missing argument: {}", argv[optind - 1]) };
			case '?':
				return { false, fmt::format("invalid argument: {}", argv[optind - 1]) };
			}
		}
	}
	catch (std::exception& e) {
		return { false, fmt::format("invalid argument: {}", e.what()) };
	}

	argc -= optind;
	argv += optind;

	if (arglist.count("batch") == 0) {
		if (argc < 1)
			return { false, usage };

		arglist["file"] = *argv;
	}
	else if (arglist.count("done-dir") == 0) {
		arglist["done-dir"] = (std::filesystem::path(arglist["batch"]).parent_path() / "done").string();
	}

	if (arglist.count("corp-id") == 0)
		if (auto env = FromEnv("DRIVE_UPLOADER_CORP_ID"))
			arglist["corp-id"] = *env;

	if (arglist.count("secret") == 0)
		if (auto env = FromEnv("DRIVE_UPLOADER_SECRET"))
			arglist["secret"] = *env;

	if (arglist.count("space-id") == 0)
		return { false, "missing argument: --space-id" };

	if (arglist.count("token") == 0 && (arglist.count("corp-id") == 0 || arglist.count("secret") == 0))
		return { false, "missing credentials: --corp-id and --secret (or --token)" };

	if (std::stoull(arglist["chunk-size"]) == 0)
		return { false, "invalid argument: --chunk-size must be positive" };

	if (std::stoul(arglist["concurrency"]) == 0)
		return { false, "invalid argument: --concurrency must be positive" };

	if (!ParseLogLevel(arglist["loglevel"]))
		return { false, fmt::format("invalid log level: {}", arglist["loglevel"]) };

	return { true, arglist };
}

void ShowArgument(const ArgList& arglist)
{
	for (const auto &[name, value]: arglist)
		spdlog::info("{}: {}", name, Mask(name, value));
}

int main(int argc, char* argv[])
{
	const auto &[success, result] = ParseArgument(argc, argv);
	if (!success) {
		spdlog::error("failed to ParseArgument(): {}", std::get<std::string>(result));
		return 1;
	}

	const ArgList& arglist = std::get<ArgList>(result);
	spdlog::set_level(*ParseLogLevel(arglist.at("loglevel")));
	ShowArgument(arglist);

	CurlRemoteApi::Options api_options;
	api_options.base_url = arglist.at("base-url");
	CurlRemoteApi api(api_options);

	TokenCache::Options token_options;
	if (arglist.count("corp-id"))
		token_options.corp_id = arglist.at("corp-id");
	if (arglist.count("secret"))
		token_options.secret = arglist.at("secret");
	if (arglist.count("token"))
		token_options.seeded_token = arglist.at("token");

	TokenCache tokens(api, token_options);
	tokens.SetRefreshListener([](const Token& token) {
		if (token.expires_at)
			spdlog::info("access token valid until {:%Y-%m-%d %H:%M:%S}",
				     fmt::localtime(Token::Clock::to_time_t(*token.expires_at)));
	});

	UploadCoordinator::Options upload_options;
	upload_options.space_id = arglist.at("space-id");
	if (arglist.count("parent-id"))
		upload_options.parent_id = arglist.at("parent-id");
	upload_options.block_size = std::stoull(arglist.at("chunk-size"));
	upload_options.concurrency = std::stoul(arglist.at("concurrency"));

	UploadCoordinator coordinator(api, tokens, upload_options);

	const auto timeout = std::chrono::seconds(std::stoul(arglist.at("timeout")));
	std::optional<UploadContext> deadline;
	if (timeout.count() > 0)
		deadline.emplace(timeout);
	else
		deadline.emplace();

	const UploadContext& context = *deadline;

	if (arglist.count("batch")) {
		BatchUploader batch(coordinator, { arglist.at("batch"), arglist.at("done-dir") });

		const auto [ok, report, err] = batch.Run(context);
		if (!ok) {
			spdlog::error("batch aborted: {}", DescribeUploadError(err));
			return 1;
		}

		return report.failed.empty() && report.unmoved.empty() ? 0 : 2;
	}

	const auto [ok, upload, err] = coordinator.Upload(arglist.at("file"), context);
	if (!ok) {
		spdlog::error("failed to upload {}: {}", arglist.at("file"), DescribeUploadError(err));
		return 1;
	}

	spdlog::info("file uploaded successfully: {}{}", upload.file_id, upload.deduplicated ? " (already stored)" : "");
	fmt::print("{}\n", upload.file_id);

	return 0;
}
