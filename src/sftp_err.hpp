#ifndef _STK_SFTP_ERR_HPP
#define _STK_SFTP_ERR_HPP

#include <cstdint>
#include <string>

/** SFTP status codes as sent by the server in SSH_FXP_STATUS */
enum SftpStatus_e {
	STK_FX_OK                  = 0,
	STK_FX_EOF                 = 1,
	STK_FX_NO_SUCH_FILE        = 2,
	STK_FX_PERMISSION_DENIED   = 3,
	STK_FX_FAILURE             = 4,
	STK_FX_BAD_MESSAGE         = 5,
	STK_FX_NO_CONNECTION       = 6,
	STK_FX_CONNECTION_LOST     = 7,
	STK_FX_OP_UNSUPPORTED      = 8,
	STK_FX_INVALID_HANDLE      = 9,
	STK_FX_NO_SUCH_PATH        = 10,
	STK_FX_FILE_ALREADY_EXISTS = 11,
	STK_FX_WRITE_PROTECT       = 12,
	STK_FX_NO_MEDIA            = 13,
	STK_FX_NO_SPACE            = 14,
	STK_FX_QUOTA_EXCEEDED      = 15,
	STK_FX_UNKNOWN_PRINCIPAL   = 16,
	STK_FX_LOCK_CONFLICT       = 17,
	STK_FX_DIR_NOT_EMPTY       = 18,
	STK_FX_NOT_A_DIRECTORY     = 19,
	STK_FX_INVALID_FILENAME    = 20,
	STK_FX_LINK_LOOP           = 21,
};

/** session code reported when a single request exceeds its timeout */
#define STK_SESSION_TIMEOUT (-9)

typedef enum ErrSource_e {
	ERR_FROM_NONE    = 0x00,
	ERR_FROM_SFTP    = 0x01,
	ERR_FROM_SESSION = 0x02,
	ERR_FROM_LOCAL   = 0x03,
	ERR_FROM_CUSTOM  = 0x04,
} ErrSource_t;

/** tag of the step that failed */
typedef enum ErrTag_e {
	ERR_TAG_NONE = 0x00,
	ERR_TAG_LOCAL_OPEN,
	ERR_TAG_REMOTE_OPEN,
	ERR_TAG_TRANSFER,
	ERR_TAG_REMOTE_CLOSE,
	ERR_TAG_LOCAL_CLOSE,
	ERR_TAG_MAKE_DIR,
	ERR_TAG_FILE_INFO,
	ERR_TAG_INVALID_TYPE,
	ERR_TAG_INVALID_ACCESS,
	ERR_TAG_LIST_DIR,
	ERR_TAG_DEL_FILE,
	ERR_TAG_DEL_DIR,
} ErrTag_t;

typedef enum TransferDir_e {
	XFER_NONE     = 0x00,
	XFER_DOWNLOAD = 0x01,
	XFER_UPLOAD   = 0x02,
} TransferDir_t;

typedef enum TransferSide_e {
	XFER_SIDE_NONE  = 0x00,
	XFER_SIDE_READ  = 0x01,
	XFER_SIDE_WRITE = 0x02,
} TransferSide_t;

typedef struct ErrCause_s   ErrCause_t;
typedef struct ToolkitErr_s ToolkitErr_t;

/** underlying cause as reported by whichever contract failed */
struct ErrCause_s {
	uint8_t     type = ERR_FROM_NONE;
	int32_t     code = 0;
	std::string msg; /**< short reason name, e.g. "no_such_file" */
};

struct ToolkitErr_s {
	uint8_t tag       = ERR_TAG_NONE;
	uint8_t direction = XFER_NONE;      /**< only for ERR_TAG_TRANSFER */
	uint8_t side      = XFER_SIDE_NONE; /**< only for ERR_TAG_TRANSFER */

	std::string path;

	/** observed values, only for invalid_type and invalid_access */
	uint8_t file_type = 0;
	uint8_t access    = 0;

	ErrCause_t cause;
};

namespace SftpErr {

const char* session_error(int32_t code);
const char* sftp_error(int32_t code);
const char* tag_name(uint8_t tag);
const char* type_name(uint8_t type);
const char* access_name(uint8_t access);

void set_sftp(ErrCause_t* cause, int32_t code);
void set_session(ErrCause_t* cause, int32_t code);
void set_errno(ErrCause_t* cause, int32_t err);
void set_custom(ErrCause_t* cause, int32_t code, const char* msg);

bool is_not_found(const ErrCause_t& cause);
void clear(ToolkitErr_t* err);

std::string format(const ToolkitErr_t& err);

}

#endif
