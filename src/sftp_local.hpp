#ifndef _SFTP_LOCAL_HPP
#define _SFTP_LOCAL_HPP

#include "local_io.hpp"

#include <cstdint>

/** LocalIo over stdio streams, the handle is a FILE* */
class PosixLocal : public LocalIo {
public:
	int32_t open(const std::string& path, uint8_t mode, LocalHandle_t* handle,
		ErrCause_t* err) override;
	int64_t read(
		LocalHandle_t handle, char* buf, size_t n, ErrCause_t* err) override;
	int32_t write(LocalHandle_t handle, const char* buf, size_t n,
		ErrCause_t* err) override;
	int32_t close(LocalHandle_t handle, ErrCause_t* err) override;
	int32_t filestat(
		const std::string& path, EntryInfo_t* info, ErrCause_t* err) override;
	int32_t remove(const std::string& path, ErrCause_t* err) override;
};

namespace SftpLocal {

uint8_t get_filetype(uint32_t mode);

}

#endif
