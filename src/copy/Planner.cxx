// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Planner.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "io/DirectoryReader.hxx"
#include "io/FileAt.hxx"
#include "io/Logger.hxx"
#include "io/Open.hxx"
#include "io/SameFile.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/ScopeExit.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <string>

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace XCopy {

static constexpr unsigned PLAN_STATX_MASK =
	STATX_TYPE|STATX_MODE|STATX_UID|STATX_GID|
	STATX_ATIME|STATX_MTIME|STATX_INO|STATX_SIZE;

struct FileIdentity {
	uint32_t dev_major, dev_minor;
	uint64_t ino;

	explicit FileIdentity(const struct statx &stx) noexcept
		:dev_major(stx.stx_dev_major), dev_minor(stx.stx_dev_minor),
		 ino(stx.stx_ino) {}

	bool operator==(const FileIdentity &) const noexcept = default;
};

struct PlanContext {
	const PlanOptions options;

	std::vector<CopyOperation> operations;

	/**
	 * The directories currently being walked.  Only needed with
	 * PlanOptions::dereference, where symlinks may form loops.
	 */
	std::vector<FileIdentity> stack;

	const LLogger logger{"planner"};

	explicit PlanContext(PlanOptions _options) noexcept
		:options(_options) {}

	int GetStatxFlags() const noexcept {
		return options.dereference ? 0 : AT_SYMLINK_NOFOLLOW;
	}

	int GetOpenFlags() const noexcept {
		return options.dereference ? 0 : O_NOFOLLOW;
	}
};

static FileMetadata
ToMetadata(const struct statx &stx) noexcept
{
	FileMetadata m;
	m.mode = stx.stx_mode;
	m.uid = stx.stx_uid;
	m.gid = stx.stx_gid;
	m.atime = {stx.stx_atime.tv_sec, stx.stx_atime.tv_nsec};
	m.mtime = {stx.stx_mtime.tv_sec, stx.stx_mtime.tv_nsec};
	return m;
}

static std::string
ReadSymlink(FileAt file)
{
	std::array<char, 4096> buffer;

	ssize_t length = readlinkat(file.directory.Get(), file.name,
				    buffer.data(), buffer.size());
	if (length < 0)
		throw FmtErrno("Failed to read symlink {:?}", file.name);

	if ((std::size_t)length == buffer.size())
		throw FmtErrno(ENAMETOOLONG, "Symlink {:?} is too long",
			       file.name);

	return {buffer.data(), (std::size_t)length};
}

static bool
IsSymlink(FileAt file) noexcept
{
	struct statx stx;
	return statx(file.directory.Get(), file.name, AT_SYMLINK_NOFOLLOW,
		     STATX_TYPE, &stx) == 0 &&
		S_ISLNK(stx.stx_mode);
}

static void
PlanEntry(PlanContext &ctx, FileAt file, const struct statx &stx,
	  const fs::path &source_path, const fs::path &relative_path);

static void
PlanDirectory(PlanContext &ctx, UniqueFileDescriptor &&fd,
	      const struct statx &stx,
	      const fs::path &source_path, const fs::path &relative_path)
{
	if (ctx.options.dereference) {
		const FileIdentity id{stx};
		if (std::find(ctx.stack.begin(), ctx.stack.end(), id) != ctx.stack.end())
			throw Error(ErrorKind::INVALID_SOURCE,
				    fmt::format("Filesystem loop detected at {:?}",
						source_path.c_str()));

		ctx.stack.push_back(id);
	}

	AtScopeExit(&ctx) {
		if (ctx.options.dereference)
			ctx.stack.pop_back();
	};

	DirectoryReader reader{std::move(fd)};
	const auto names = reader.ReadSortedNames();
	const FileDescriptor directory_fd = reader.GetFileDescriptor();

	for (const auto &name : names) {
		const FileAt child{directory_fd, name.c_str()};

		struct statx child_stx;
		if (statx(child.directory.Get(), child.name,
			  ctx.GetStatxFlags()|AT_STATX_SYNC_AS_STAT,
			  PLAN_STATX_MASK, &child_stx) < 0) {
			if (const int e = errno; e == ENOENT) {
				if (ctx.options.dereference &&
				    IsSymlink(child))
					throw Error(ErrorKind::INVALID_SOURCE,
						    fmt::format("Dangling symlink {:?}",
								(source_path / name).c_str()));

				/* deleted meanwhile */
				ctx.logger.Fmt(2, "Skipping vanished entry {:?}",
					       (source_path / name).c_str());
				continue;
			} else
				throw FmtErrno(e, "Failed to stat {:?}",
					       (source_path / name).c_str());
		}

		PlanEntry(ctx, child, child_stx,
			  source_path / name, relative_path / name);
	}
}

static void
PlanEntry(PlanContext &ctx, FileAt file, const struct statx &stx,
	  const fs::path &source_path, const fs::path &relative_path)
{
	CopyOperation operation{
		.kind = CopyOperation::Kind::FILE,
		.source_path = source_path,
		.relative_path = relative_path,
		.metadata = ToMetadata(stx),
	};

	switch (stx.stx_mode & S_IFMT) {
	case S_IFREG:
		operation.size = stx.stx_size;
		ctx.operations.emplace_back(std::move(operation));
		break;

	case S_IFLNK:
		operation.kind = CopyOperation::Kind::SYMLINK;
		operation.link_target = ReadSymlink(file);
		ctx.operations.emplace_back(std::move(operation));
		break;

	case S_IFDIR:
		operation.kind = CopyOperation::Kind::DIRECTORY;
		ctx.operations.emplace_back(std::move(operation));

		PlanDirectory(ctx,
			      OpenDirectory(file, ctx.GetOpenFlags()),
			      stx, source_path, relative_path);
		break;

	default:
		ctx.logger.Fmt(1, "Skipping special file {:?}",
			       source_path.c_str());
		break;
	}
}

void
CheckNotSameObject(const fs::path &source, bool is_directory,
		   const fs::path &destination)
{
	const auto source_at = FileAt::CurrentDirectory(source.c_str());

	if (!is_directory) {
		const auto destination_at = FileAt::CurrentDirectory(destination.c_str());
		if (IsSameFile(source_at, destination_at, true) ||
		    IsSameFile(source_at, destination_at, false))
			throw Error(ErrorKind::DESTINATION_EXISTS,
				    "Source and destination is the same file.");
		return;
	}

	/* check the destination and all of its (existing) parent
	   directories */
	fs::path p = fs::absolute(destination).lexically_normal();
	while (true) {
		if (IsSameFile(source_at, FileAt::CurrentDirectory(p.c_str())))
			throw Error(ErrorKind::INVALID_SOURCE,
				    "Cannot copy a directory into itself");

		if (!p.has_relative_path())
			break;

		p = p.parent_path();
	}
}

std::vector<CopyOperation>
PlanCopy(const fs::path &source, const fs::path &destination,
	 PlanOptions options)
{
	PlanContext ctx{options};

	const auto source_at = FileAt::CurrentDirectory(source.c_str());

	struct statx stx;
	if (statx(source_at.directory.Get(), source_at.name,
		  ctx.GetStatxFlags()|AT_STATX_SYNC_AS_STAT,
		  PLAN_STATX_MASK, &stx) < 0) {
		switch (const int e = errno) {
		case ENOENT:
		case ENOTDIR:
			throw Error(ErrorKind::INVALID_SOURCE,
				    "Source does not exist.");

		default:
			throw FmtErrno(e, "Failed to stat {:?}", source.c_str());
		}
	}

	const bool is_directory = S_ISDIR(stx.stx_mode);
	if (is_directory && !options.recursive)
		throw Error(ErrorKind::INVALID_SOURCE,
			    "Source is directory and --recursive not specified.");

	CheckNotSameObject(source, is_directory, destination);

	PlanEntry(ctx, source_at, stx, source, {});

	ctx.logger.Fmt(3, "Planned {} operations for {:?}",
		       ctx.operations.size(), source.c_str());

	return std::move(ctx.operations);
}

/**
 * Determine the name of the given path, even if it ends with a slash
 * or is "." (i.e. the name of the directory it refers to).
 */
static fs::path
GetBaseName(const fs::path &path)
{
	auto name = path.filename();
	if (!name.empty() && name != "." && name != "..")
		return name;

	auto normal = fs::absolute(path).lexically_normal();
	if (normal.filename().empty())
		normal = normal.parent_path();

	return normal.filename();
}

fs::path
GetTargetPath(const fs::path &source, const fs::path &destination)
{
	std::error_code ec;
	if (!fs::is_directory(destination, ec))
		return destination;

	return destination / GetBaseName(source);
}

static PlanOptions
ToPlanOptions(const CopyConfig &config) noexcept
{
	return {
		.recursive = config.recursive,
		.dereference = config.dereference,
	};
}

CopyJob
PlanSingleJob(const fs::path &source, const fs::path &destination,
	      const CopyConfig &config)
{
	return {
		destination,
		PlanCopy(source, destination, ToPlanOptions(config)),
	};
}

std::vector<CopyJob>
PlanJobs(std::span<const fs::path> sources, const fs::path &destination,
	 const CopyConfig &config)
{
	std::vector<CopyJob> jobs;
	jobs.reserve(sources.size());

	for (const auto &source : sources) {
		auto target = GetTargetPath(source, destination);
		auto operations = PlanCopy(source, target, ToPlanOptions(config));
		jobs.push_back({std::move(target), std::move(operations)});
	}

	return jobs;
}

} // namespace XCopy
