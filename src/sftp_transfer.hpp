#ifndef _SFTP_TRANSFER_HPP
#define _SFTP_TRANSFER_HPP

#include "local_io.hpp"
#include "remote_channel.hpp"
#include "sftp_err.hpp"
#include "sftp_toolkit.hpp"

#include <cstdint>
#include <string>

namespace SftpTransfer {

/**
 * Copy @p remote_path into @p local_path, reading at most
 * TransferOpts_s::chunk_size bytes at a time.
 *
 * Both handles are only closed-and-checked after the whole file went through.
 * A failing close is reported even though the data already arrived, and a
 * partially written local file is left as is on failure.
 *
 * When the transfer loop fails, close is still issued on both handles but
 * its result is only logged, the loop error is what gets returned.
 * */
int32_t download_file(RemoteChannel& ch, LocalIo& local,
	const std::string& remote_path, const std::string& local_path,
	const TransferOpts_t& opts, ToolkitErr_t* err);

/** mirror of download_file(), the remote file is created or truncated */
int32_t upload_file(RemoteChannel& ch, LocalIo& local,
	const std::string& local_path, const std::string& remote_path,
	const TransferOpts_t& opts, ToolkitErr_t* err);

}

#endif
