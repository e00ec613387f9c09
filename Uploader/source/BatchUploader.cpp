#include "BatchUploader.hpp"

#include <algorithm>
#include <system_error>

#include "fmt/core.h"

namespace fs = std::filesystem;

namespace {
	UploadError IOError(const std::error_code& ec, const std::string& what)
	{
		return MakeUploadError(ErrorKind::LocalIO, ec.value(), fmt::format("{}: {}", what, ec.message()));
	}
}

BatchUploader::BatchUploader(UploadCoordinator& coordinator, Options options,
			     std::shared_ptr<spdlog::logger> logger)
	: coordinator_(coordinator)
	, options_(std::move(options))
	, logger_(logger ? std::move(logger) : spdlog::default_logger())
{
}

std::tuple<bool, std::vector<fs::path>, BatchUploader::Error> BatchUploader::ListPending() const
{
	std::vector<fs::path> files;
	std::error_code ec;

	fs::directory_iterator it(options_.source_dir, ec);
	if (ec)
		return { false, files, IOError(ec, fmt::format("cannot list {}", options_.source_dir.string())) };

	for (const fs::directory_entry& entry : it) {
		std::error_code type_ec;
		if (entry.is_regular_file(type_ec))
			files.push_back(entry.path());
	}

	std::sort(files.begin(), files.end());

	return { true, std::move(files), NoUploadError() };
}

std::tuple<bool, fs::path, BatchUploader::Error> BatchUploader::MoveToDone(const fs::path& file) const
{
	const fs::path target = options_.done_dir / file.filename();
	std::error_code ec;

	fs::rename(file, target, ec);
	if (!ec)
		return { true, target, NoUploadError() };

	// rename() cannot cross file systems
	if (ec != std::errc::cross_device_link)
		return { false, target, IOError(ec, fmt::format("cannot move {}", file.string())) };

	ec.clear();
	if (!fs::copy_file(file, target, fs::copy_options::overwrite_existing, ec))
		return { false, target, IOError(ec, fmt::format("cannot copy {}", file.string())) };

	if (!fs::remove(file, ec))
		return { false, target, IOError(ec, fmt::format("cannot remove {}", file.string())) };

	return { true, target, NoUploadError() };
}

std::tuple<bool, BatchUploader::Report, BatchUploader::Error> BatchUploader::Run(const UploadContext& context)
{
	Report report;
	std::error_code ec;

	if (!fs::exists(options_.source_dir, ec)) {
		if (!fs::create_directories(options_.source_dir, ec) && ec)
			return { false, report, IOError(ec, fmt::format("cannot create {}", options_.source_dir.string())) };

		logger_->info("created source directory {}; put files to upload there", options_.source_dir.string());
		return { true, report, NoUploadError() };
	}

	if (!fs::is_directory(options_.source_dir, ec))
		return { false, report, MakeUploadError(ErrorKind::LocalIO, -1,
			 fmt::format("{} is not a directory", options_.source_dir.string())) };

	if (!fs::exists(options_.done_dir, ec)) {
		if (!fs::create_directories(options_.done_dir, ec) && ec)
			return { false, report, IOError(ec, fmt::format("cannot create {}", options_.done_dir.string())) };

		logger_->info("created done directory {}", options_.done_dir.string());
	}

	auto [listed, files, list_err] = ListPending();
	if (!listed)
		return { false, report, list_err };

	if (files.empty()) {
		logger_->info("{} is empty, nothing to upload", options_.source_dir.string());
		return { true, report, NoUploadError() };
	}

	logger_->info("found {} file(s) in {}", files.size(), options_.source_dir.string());

	for (const fs::path& file : files) {
		if (context.IsCancelled())
			return { false, report, MakeUploadError(ErrorKind::Cancelled, -1, "batch cancelled") };

		logger_->info("======== {} ========", file.filename().string());

		auto [ok, result, err] = coordinator_.Upload(file, context);
		if (!ok) {
			logger_->error("upload of {} failed, leaving it in place: {}", file.string(), DescribeUploadError(err));
			report.failed.emplace_back(file, err);
			continue;
		}

		report.uploaded.emplace_back(file, result.file_id);

		auto [moved, target, move_err] = MoveToDone(file);
		if (!moved) {
			logger_->error("{}", DescribeUploadError(move_err));
			report.unmoved.push_back(file);
			continue;
		}

		logger_->info("moved {} to {}", file.filename().string(), target.parent_path().string());
	}

	logger_->info("batch finished: {} uploaded, {} failed", report.uploaded.size(), report.failed.size());

	return { true, std::move(report), NoUploadError() };
}
