#ifndef _STK_LOCAL_IO_HPP
#define _STK_LOCAL_IO_HPP

#include "sftp_err.hpp"
#include "sftp_toolkit.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

typedef void* LocalHandle_t;

typedef enum LocalOpenMode_e {
	LOCAL_OPEN_READ  = 0x01,
	LOCAL_OPEN_WRITE = 0x02, /**< create if missing, truncate if present */
} LocalOpenMode_t;

/**
 * Local file access used by the transfer engine. Mirrors the remote channel,
 * without timeouts.
 * */
class LocalIo {
public:
	virtual ~LocalIo() = default;

	virtual int32_t open(const std::string& path, uint8_t mode,
		LocalHandle_t* handle, ErrCause_t* err)
		= 0;

	/** @return bytes read, 0 at end of file, negative on error */
	virtual int64_t read(
		LocalHandle_t handle, char* buf, size_t n, ErrCause_t* err)
		= 0;

	virtual int32_t write(
		LocalHandle_t handle, const char* buf, size_t n, ErrCause_t* err)
		= 0;

	virtual int32_t close(LocalHandle_t handle, ErrCause_t* err) = 0;

	/** lstat-like, fills @p info when not null */
	virtual int32_t filestat(
		const std::string& path, EntryInfo_t* info, ErrCause_t* err)
		= 0;

	virtual int32_t remove(const std::string& path, ErrCause_t* err) = 0;
};

#endif
