#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "UploadContext.hpp"
#include "UploadCoordinator.hpp"

// Uploads every regular file of a source directory, one after another, and
// moves each uploaded file into the done directory. A failed file is left
// where it is and does not stop the batch.
class BatchUploader
{
public:
	using Error = UploadError;

	struct Options {
		std::filesystem::path source_dir;
		std::filesystem::path done_dir;
	};

	struct Report {
		std::vector<std::pair<std::filesystem::path, std::string>> uploaded; // path, file id
		std::vector<std::pair<std::filesystem::path, Error>> failed;

		// uploaded but could not be moved
		std::vector<std::filesystem::path> unmoved;

		std::size_t Total() const noexcept { return uploaded.size() + failed.size(); }
	};

public:
	BatchUploader(const BatchUploader&) = delete;
	BatchUploader& operator=(const BatchUploader&) = delete;

public:
	BatchUploader(UploadCoordinator& coordinator, Options options,
		      std::shared_ptr<spdlog::logger> logger = nullptr);

public:
	// Fails only when the directories themselves are unusable or the
	// context is cancelled; per-file failures go into the report.
	std::tuple<bool, Report, Error> Run(const UploadContext& context);

	// Regular files directly inside the source directory, sorted by name.
	std::tuple<bool, std::vector<std::filesystem::path>, Error> ListPending() const;

private:
	std::tuple<bool, std::filesystem::path, Error> MoveToDone(const std::filesystem::path& file) const;

private:
	UploadCoordinator& coordinator_;
	const Options options_;
	std::shared_ptr<spdlog::logger> logger_;
};
