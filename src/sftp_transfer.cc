#include "sftp_transfer.hpp"

#include "debug.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace {

static int32_t prv_fail(ToolkitErr_t* err, uint8_t tag,
	const std::string& path, const ErrCause_t& cause)
{
	LOG_ERR("%s failed on '%s': %s (%d)\n", SftpErr::tag_name(tag),
		path.c_str(), cause.msg.c_str(), cause.code);

	if (!err) return -1;

	SftpErr::clear(err);
	err->tag   = tag;
	err->path  = path;
	err->cause = cause;

	return -1;
}

static int32_t prv_fail_xfer(ToolkitErr_t* err, uint8_t direction,
	uint8_t side, const std::string& path, const ErrCause_t& cause)
{
	prv_fail(err, ERR_TAG_TRANSFER, path, cause);

	if (err) {
		err->direction = direction;
		err->side      = side;
	}

	return -1;
}

/*
 * Release handles on the error path. The step that failed first is what gets
 * reported, so a close failure here is only logged.
 * */
static void prv_release_remote(
	RemoteChannel& ch, RemoteHandle_t handle, uint32_t timeout_ms)
{
	ErrCause_t cause;

	if (ch.close(handle, timeout_ms, &cause)) {
		LOG_WRN("Unable to release remote handle: %s (%d)\n",
			cause.msg.c_str(), cause.code);
	}
}

static void prv_release_local(LocalIo& local, LocalHandle_t handle)
{
	ErrCause_t cause;

	if (local.close(handle, &cause)) {
		LOG_WRN("Unable to release local handle: %s (%d)\n",
			cause.msg.c_str(), cause.code);
	}
}

static uint32_t prv_chunk_size(const TransferOpts_t& opts)
{
	return opts.chunk_size ? opts.chunk_size : STK_DEFAULT_CHUNK_SIZE;
}

}

int32_t SftpTransfer::download_file(RemoteChannel& ch, LocalIo& local,
	const std::string& remote_path, const std::string& local_path,
	const TransferOpts_t& opts, ToolkitErr_t* err)
{
	ErrCause_t     cause;
	LocalHandle_t  fd_local = nullptr;
	RemoteHandle_t handle   = nullptr;

	// remembered so a failed remote open does not leave an empty file behind
	bool is_existing = local.filestat(local_path, nullptr, &cause) == 0;

	if (local.open(local_path, LOCAL_OPEN_WRITE, &fd_local, &cause)) {
		return prv_fail(err, ERR_TAG_LOCAL_OPEN, local_path, cause);
	}

	if (ch.open(remote_path, REMOTE_OPEN_READ, &handle, opts.timeout_ms,
			&cause)) {
		prv_release_local(local, fd_local);

		ErrCause_t rm_cause;
		if (!is_existing && local.remove(local_path, &rm_cause)) {
			LOG_WRN("Unable to remove '%s': %s\n", local_path.c_str(),
				rm_cause.msg.c_str());
		}

		return prv_fail(err, ERR_TAG_REMOTE_OPEN, remote_path, cause);
	}

	std::vector<char> mem(prv_chunk_size(opts));
	uint64_t          total = 0;

	while (1) {
		int64_t nread
			= ch.read(handle, mem.data(), mem.size(), opts.timeout_ms, &cause);

		// end of file
		if (nread == 0) break;

		if (nread < 0) {
			prv_release_remote(ch, handle, opts.timeout_ms);
			prv_release_local(local, fd_local);
			return prv_fail_xfer(
				err, XFER_DOWNLOAD, XFER_SIDE_READ, remote_path, cause);
		}

		if (local.write(
				fd_local, mem.data(), static_cast<size_t>(nread), &cause)) {
			prv_release_remote(ch, handle, opts.timeout_ms);
			prv_release_local(local, fd_local);
			return prv_fail_xfer(
				err, XFER_DOWNLOAD, XFER_SIDE_WRITE, local_path, cause);
		}

		total += static_cast<uint64_t>(nread);
	}

	if (ch.close(handle, opts.timeout_ms, &cause)) {
		prv_release_local(local, fd_local);
		return prv_fail(err, ERR_TAG_REMOTE_CLOSE, remote_path, cause);
	}

	if (local.close(fd_local, &cause)) {
		return prv_fail(err, ERR_TAG_LOCAL_CLOSE, local_path, cause);
	}

	LOG_DBG("downloaded '%s' -> '%s' (%llu bytes)\n", remote_path.c_str(),
		local_path.c_str(), static_cast<unsigned long long>(total));

	return 0;
}

int32_t SftpTransfer::upload_file(RemoteChannel& ch, LocalIo& local,
	const std::string& local_path, const std::string& remote_path,
	const TransferOpts_t& opts, ToolkitErr_t* err)
{
	ErrCause_t     cause;
	LocalHandle_t  fd_local = nullptr;
	RemoteHandle_t handle   = nullptr;

	if (local.open(local_path, LOCAL_OPEN_READ, &fd_local, &cause)) {
		return prv_fail(err, ERR_TAG_LOCAL_OPEN, local_path, cause);
	}

	if (ch.open(remote_path, REMOTE_OPEN_WRITE, &handle, opts.timeout_ms,
			&cause)) {
		prv_release_local(local, fd_local);
		return prv_fail(err, ERR_TAG_REMOTE_OPEN, remote_path, cause);
	}

	std::vector<char> mem(prv_chunk_size(opts));
	uint64_t          total = 0;

	while (1) {
		int64_t nread = local.read(fd_local, mem.data(), mem.size(), &cause);

		// end of file
		if (nread == 0) break;

		if (nread < 0) {
			prv_release_remote(ch, handle, opts.timeout_ms);
			prv_release_local(local, fd_local);
			return prv_fail_xfer(
				err, XFER_UPLOAD, XFER_SIDE_READ, local_path, cause);
		}

		if (ch.write(handle, mem.data(), static_cast<size_t>(nread),
				opts.timeout_ms, &cause)) {
			prv_release_remote(ch, handle, opts.timeout_ms);
			prv_release_local(local, fd_local);
			return prv_fail_xfer(
				err, XFER_UPLOAD, XFER_SIDE_WRITE, remote_path, cause);
		}

		total += static_cast<uint64_t>(nread);
	}

	if (ch.close(handle, opts.timeout_ms, &cause)) {
		prv_release_local(local, fd_local);
		return prv_fail(err, ERR_TAG_REMOTE_CLOSE, remote_path, cause);
	}

	if (local.close(fd_local, &cause)) {
		return prv_fail(err, ERR_TAG_LOCAL_CLOSE, local_path, cause);
	}

	LOG_DBG("uploaded '%s' -> '%s' (%llu bytes)\n", local_path.c_str(),
		remote_path.c_str(), static_cast<unsigned long long>(total));

	return 0;
}
