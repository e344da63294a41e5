#ifndef _STK_REMOTE_CHANNEL_HPP
#define _STK_REMOTE_CHANNEL_HPP

#include "sftp_err.hpp"
#include "sftp_toolkit.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

typedef void* RemoteHandle_t;

typedef enum RemoteOpenMode_e {
	REMOTE_OPEN_READ  = 0x01,
	REMOTE_OPEN_WRITE = 0x02, /**< create if missing, truncate if present */
} RemoteOpenMode_t;

/**
 * Operations the toolkit needs from an established SFTP session.
 *
 * Every call blocks until the server answers or until @p timeout_ms elapsed.
 * On failure the return value is negative and @p err holds the cause, a
 * timeout being reported like any other session error.
 *
 * The channel is always borrowed by the toolkit, it is never created nor
 * destroyed by the tree or transfer engines.
 * */
class RemoteChannel {
public:
	virtual ~RemoteChannel() = default;

	/** lstat-like, symbolic links are reported as links */
	virtual int32_t stat(const std::string& path, EntryInfo_t* info,
		uint32_t timeout_ms, ErrCause_t* err)
		= 0;

	/** raw names of the directory entries, including "." and ".." */
	virtual int32_t list(const std::string& path,
		std::vector<std::string>* names, uint32_t timeout_ms, ErrCause_t* err)
		= 0;

	virtual int32_t mkdir(
		const std::string& path, uint32_t timeout_ms, ErrCause_t* err)
		= 0;

	virtual int32_t remove_file(
		const std::string& path, uint32_t timeout_ms, ErrCause_t* err)
		= 0;

	virtual int32_t remove_dir(
		const std::string& path, uint32_t timeout_ms, ErrCause_t* err)
		= 0;

	virtual int32_t open(const std::string& path, uint8_t mode,
		RemoteHandle_t* handle, uint32_t timeout_ms, ErrCause_t* err)
		= 0;

	/**
	 * Read up to @p n bytes.
	 * @return number of bytes read, 0 at end of file, negative on error
	 * */
	virtual int64_t read(RemoteHandle_t handle, char* buf, size_t n,
		uint32_t timeout_ms, ErrCause_t* err)
		= 0;

	/** write all @p n bytes */
	virtual int32_t write(RemoteHandle_t handle, const char* buf, size_t n,
		uint32_t timeout_ms, ErrCause_t* err)
		= 0;

	virtual int32_t close(
		RemoteHandle_t handle, uint32_t timeout_ms, ErrCause_t* err)
		= 0;
};

#endif
