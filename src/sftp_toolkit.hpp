#ifndef _SFTP_TOOLKIT_HPP
#define _SFTP_TOOLKIT_HPP

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#ifndef STK_DEFAULT_CHUNK_SIZE
#	define STK_DEFAULT_CHUNK_SIZE 32768U
#endif

/** timeout of every single remote request, not the whole operation */
#ifndef STK_DEFAULT_TIMEOUT_MS
#	define STK_DEFAULT_TIMEOUT_MS 5000U
#endif

#ifndef SFTP_FILENAME_MAX_LEN
#	define SFTP_FILENAME_MAX_LEN 512
#endif

#define STK_SEP      "/"
#define STK_SEP_CHAR STK_SEP[0]

#define STK_CAN_READ(info)  (((info).access & ACCESS_READ) != 0)
#define STK_CAN_WRITE(info) (((info).access & ACCESS_WRITE) != 0)

enum FileType_e {
	IS_INVALID  = '0', /**< unknown, or server did not report permissions */
	IS_SYMLINK  = 'l',
	IS_REG_FILE = 'f',
	IS_DIR      = 'd',
	IS_CHR_FILE = 'c',
	IS_BLK_FILE = 'b',
	IS_PIPE     = 'p',
	IS_SOCK     = 's',
};

/** access granted to the logged in principal, bitmask of read and write */
enum Access_e {
	ACCESS_NONE       = 0x00,
	ACCESS_READ       = 0x01,
	ACCESS_WRITE      = 0x02,
	ACCESS_READ_WRITE = (ACCESS_READ | ACCESS_WRITE),
};

typedef enum Decision_e {
	DECIDE_PROCEED          = 0x00,
	DECIDE_SKIP             = 0x01,
	DECIDE_SKIP_BUT_INCLUDE = 0x02,
} Decision_t;

typedef enum ResultFormat_e {
	RESULT_PATH      = 0x00,
	RESULT_FILE_INFO = 0x01,
} ResultFormat_t;

typedef void* UserData_t;

typedef struct EntryInfo_s      EntryInfo_t;
typedef struct ListItem_s       ListItem_t;
typedef struct TreeOpts_s       TreeOpts_t;
typedef struct ListOpts_s       ListOpts_t;
typedef struct TransferOpts_s   TransferOpts_t;

typedef std::vector<ListItem_t> ListResult_t;

/**
 * Decision hook for list_dir_recursive. Receives the full path of the entry
 * currently evaluated and the user data stored in #ListOpts_s.
 * */
typedef Decision_t (*path_decision_cb)(
	const std::string& path, UserData_t data);

struct EntryInfo_s {
	uint8_t  type   = IS_INVALID;
	uint8_t  access = ACCESS_NONE;
	uint64_t size   = 0;
	uint64_t atime  = 0;
	uint64_t mtime  = 0;
	uint32_t perm   = 0;
	uint32_t uid    = 0;
	uint32_t gid    = 0;
};

struct ListItem_s {
	std::string path;

	/** false for path-only results and for entries never stat-ed */
	bool        has_info = false;
	EntryInfo_t info;
};

struct TreeOpts_s {
	uint32_t timeout_ms = STK_DEFAULT_TIMEOUT_MS;
};

struct ListOpts_s {
	uint32_t timeout_ms = STK_DEFAULT_TIMEOUT_MS;

	/** set of #FileType_e to be put into the result */
	std::unordered_set<uint8_t> included_types = { IS_REG_FILE };

	uint8_t result_format = RESULT_PATH;

	/** called before stat-ing every entry found, may be null */
	path_decision_cb iterate_cb = nullptr;

	/** called before descending into every readable directory, may be null */
	path_decision_cb recurse_cb = nullptr;

	UserData_t user_data = nullptr;
};

struct TransferOpts_s {
	uint32_t chunk_size = STK_DEFAULT_CHUNK_SIZE; /**< 0 selects default */
	uint32_t timeout_ms = STK_DEFAULT_TIMEOUT_MS;
};

#endif
