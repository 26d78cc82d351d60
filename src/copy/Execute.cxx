// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Execute.hxx"
#include "Error.hxx"
#include "Operation.hxx"
#include "Planner.hxx"
#include "io/FileAt.hxx"
#include "io/Logger.hxx"
#include "io/MakeDirectory.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "io/linux/Reflink.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <string.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace XCopy {

static const LLogger logger{"copy"};

ExecuteOptions::ExecuteOptions(const CopyConfig &config, DriverKind kind) noexcept
	:probe_reflink(kind == DriverKind::PARALLEL),
	 no_clobber(config.no_clobber),
	 preserve_metadata(config.preserve_metadata),
	 partial_file_policy(config.partial_file_policy)
{
	copy.block_size = config.block_size;

	/* the sequential driver lets the kernel copy; the parallel
	   driver clones if possible and falls back to buffered
	   copies */
	copy.copy_file_range = kind == DriverKind::SEQUENTIAL;
}

static void
LogErrno(const char *what, const char *path) noexcept
{
	logger.Fmt(2, "{} {:?}: {}", what, path, strerror(errno));
}

/**
 * Apply ownership, mode and time stamps to a newly copied file.
 * Failures are logged, but are not fatal.
 */
static void
PreserveFile(FileDescriptor fd, const FileMetadata &metadata,
	     const char *path) noexcept
{
	/* change the owner first, because chown() clears the
	   set-user-id bit */
	if (fchown(fd.Get(), metadata.uid, metadata.gid) < 0)
		LogErrno("Failed to change owner of", path);

	if (fchmod(fd.Get(), metadata.mode & 07777) < 0)
		LogErrno("Failed to set mode of", path);

	const struct timespec times[2]{metadata.atime, metadata.mtime};
	if (futimens(fd.Get(), times) < 0)
		LogErrno("Failed to set time of", path);
}

static void
PreserveSymlink(const FileMetadata &metadata, const char *path) noexcept
{
	/* symlinks have no mode on Linux */

	if (fchownat(AT_FDCWD, path, metadata.uid, metadata.gid,
		     AT_SYMLINK_NOFOLLOW) < 0)
		LogErrno("Failed to change owner of", path);

	const struct timespec times[2]{metadata.atime, metadata.mtime};
	if (utimensat(AT_FDCWD, path, times, AT_SYMLINK_NOFOLLOW) < 0)
		LogErrno("Failed to set time of", path);
}

static void
CreateDirectory(const CopyOperation &operation, const fs::path &path,
		const ExecuteOptions &options)
{
	/* the owner needs full access while the directory gets
	   populated; FinishDirectories() applies the final mode */
	const MakeDirectoryOptions mkdir_options{
		.mode = (operation.metadata.mode & 07777) | S_IRWXU,
		.follow_symlinks = operation.relative_path.empty(),
	};

	const auto result = operation.relative_path.empty()
		/* the destination root may need parent directories */
		? MakeNestedDirectory(path, mkdir_options)
		: MakeDirectory(FileAt::CurrentDirectory(path.c_str()),
				mkdir_options);

	if (!result.created)
		logger.Fmt(4, "Merging into existing directory {:?}",
			   path.c_str());

	if (options.preserve_metadata &&
	    fchown(result.fd.Get(), operation.metadata.uid,
		   operation.metadata.gid) < 0)
		LogErrno("Failed to change owner of", path.c_str());
}

/**
 * Create a regular file.  If one already exists, it is deleted (so
 * we create a new inode for the new file), unless #overwrite is
 * false.
 */
static UniqueFileDescriptor
CreateRegularFile(const char *path, mode_t mode, bool overwrite)
{
	UniqueFileDescriptor dst;

	/* optimistic create with O_EXCL */
	if (dst.Open(path, O_CREAT|O_EXCL|O_WRONLY|O_NOFOLLOW, mode))
		return dst;

	if (const int e = errno; e != EEXIST)
		throw FmtErrno(e, "Failed to create {:?}", path);

	if (!overwrite)
		throw Error(ErrorKind::DESTINATION_EXISTS,
			    "Destination file exists and --no-clobber is set.");

	if (unlink(path) < 0)
		if (const int e = errno; e != ENOENT)
			throw FmtErrno(e, "Failed to delete {:?}", path);

	/* ... and try again */
	if (!dst.Open(path, O_CREAT|O_EXCL|O_WRONLY|O_NOFOLLOW, mode))
		throw FmtErrno("Failed to create {:?}", path);

	return dst;
}

/**
 * Forwards CopyRegularFile() progress to the status channel.
 */
class StatusCopyHandler final : public CopyRegularFileHandler {
	StatusSender &status;

public:
	explicit StatusCopyHandler(StatusSender &_status) noexcept
		:status(_status) {}

	/* virtual methods from CopyRegularFileHandler */
	void OnCopyProgress(std::size_t nbytes) override {
		status.Send(CopiedUpdate{nbytes});
	}
};

static const char *
ToString(CopyMethod method) noexcept
{
	switch (method) {
	case CopyMethod::NONE:
		return "nothing";

	case CopyMethod::CLONE:
		return "clone";

	case CopyMethod::COPY_FILE_RANGE:
		return "copy_file_range";

	case CopyMethod::READ_WRITE:
		return "read/write";
	}

	return "?";
}

static void
CopyFile(const CopyOperation &operation, const fs::path &path,
	 const ExecuteOptions &options, StatusSender &status)
{
	const auto src = OpenReadOnly(operation.source_path.c_str());
	auto dst = CreateRegularFile(path.c_str(),
				     operation.metadata.mode & 0777,
				     !options.no_clobber);

	status.Send(SizeUpdate{operation.size});

	auto copy_options = options.copy;
	if (options.probe_reflink)
		copy_options.clone = IsReflinkCapable(src, dst);

	try {
		StatusCopyHandler handler{status};
		const auto method = CopyRegularFile(src, dst, operation.size,
						    copy_options, handler);
		logger.Fmt(4, "Copied {:?} using {}",
			   path.c_str(), ToString(method));

		if (options.preserve_metadata)
			PreserveFile(dst, operation.metadata, path.c_str());
	} catch (...) {
		if (options.partial_file_policy == PartialFilePolicy::REMOVE) {
			dst.Close();
			if (unlink(path.c_str()) < 0)
				LogErrno("Failed to delete partial file", path.c_str());
		}

		throw;
	}
}

static void
CreateSymlink(const CopyOperation &operation, const fs::path &path,
	      const ExecuteOptions &options)
{
	const char *target = operation.link_target.c_str();

	if (symlink(target, path.c_str()) < 0) {
		if (const int e = errno; e != EEXIST)
			throw FmtErrno(e, "Failed to create symlink {:?}",
				       path.c_str());

		if (options.no_clobber)
			throw Error(ErrorKind::DESTINATION_EXISTS,
				    "Destination file exists and --no-clobber is set.");

		if (unlink(path.c_str()) < 0)
			if (const int e = errno; e != ENOENT)
				throw FmtErrno(e, "Failed to delete {:?}",
					       path.c_str());

		if (symlink(target, path.c_str()) < 0)
			throw FmtErrno("Failed to create symlink {:?}",
				       path.c_str());
	}

	if (options.preserve_metadata)
		PreserveSymlink(operation.metadata, path.c_str());
}

void
ExecuteOperation(const CopyOperation &operation,
		 const fs::path &destination_root,
		 const ExecuteOptions &options,
		 StatusSender &status)
{
	const auto path = operation.GetDestination(destination_root);

	logger.Fmt(3, "Copying {} {:?} to {:?}", ToString(operation.kind),
		   operation.source_path.c_str(), path.c_str());

	try {
		switch (operation.kind) {
		case CopyOperation::Kind::DIRECTORY:
			CreateDirectory(operation, path, options);
			break;

		case CopyOperation::Kind::FILE:
			CopyFile(operation, path, options, status);
			break;

		case CopyOperation::Kind::SYMLINK:
			CreateSymlink(operation, path, options);
			break;
		}
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Failed to copy {} {:?} to {:?}",
						       ToString(operation.kind),
						       operation.source_path.c_str(),
						       path.c_str()));
	}
}

void
FinishDirectories(const CopyJob &job, const ExecuteOptions &options) noexcept
{
	/* reverse order: children before their parents, so setting
	   the time stamps of a child does not modify its parent's
	   time stamps afterwards */
	for (auto i = job.operations.rbegin(); i != job.operations.rend(); ++i) {
		const auto &operation = *i;
		if (operation.kind != CopyOperation::Kind::DIRECTORY)
			continue;

		const auto path = operation.GetDestination(job.destination);
		const auto &metadata = operation.metadata;

		if ((options.preserve_metadata ||
		     (metadata.mode & S_IRWXU) != S_IRWXU) &&
		    fchmodat(AT_FDCWD, path.c_str(), metadata.mode & 07777, 0) < 0)
			LogErrno("Failed to set mode of", path.c_str());

		if (options.preserve_metadata) {
			const struct timespec times[2]{metadata.atime, metadata.mtime};
			if (utimensat(AT_FDCWD, path.c_str(), times, 0) < 0)
				LogErrno("Failed to set time of", path.c_str());
		}
	}
}

} // namespace XCopy
