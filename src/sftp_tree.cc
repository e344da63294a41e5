#include "sftp_tree.hpp"

#include "debug.hpp"

#include <cstdint>
#include <string>
#include <vector>

/* ******************** Start of Static Functions *************************** */
namespace {

/** path sent to the server, the empty path means the working directory */
static std::string prv_remote(const std::string& path)
{
	return path.empty() ? std::string(".") : path;
}

static bool prv_is_dot(const std::string& name)
{
	return name == "." || name == "..";
}

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

static int32_t prv_fail_type(
	ToolkitErr_t* err, const std::string& path, uint8_t type)
{
	LOG_ERR("'%s' is not a directory but %s\n", path.c_str(),
		SftpErr::type_name(type));

	if (!err) return -1;

	SftpErr::clear(err);
	err->tag       = ERR_TAG_INVALID_TYPE;
	err->path      = path;
	err->file_type = type;

	return -1;
}

static int32_t prv_fail_access(
	ToolkitErr_t* err, const std::string& path, uint8_t access)
{
	LOG_ERR("directory '%s' has invalid access %s\n", path.c_str(),
		SftpErr::access_name(access));

	if (!err) return -1;

	SftpErr::clear(err);
	err->tag    = ERR_TAG_INVALID_ACCESS;
	err->path   = path;
	err->access = access;

	return -1;
}

static void prv_push(ListResult_t* acc, const ListOpts_t& opts,
	const std::string& path, const EntryInfo_t* info)
{
	ListItem_t item;
	item.path = path;

	if (info && opts.result_format == RESULT_FILE_INFO) {
		item.has_info = true;
		item.info     = *info;
	}

	acc->push_back(item);
}

/**
 * Remove the content of @p path and then @p path itself. The caller must have
 * just stat-ed @p path, its attributes are passed as @p info.
 * */
static int32_t prv_del_dir(RemoteChannel& ch, const std::string& path,
	const EntryInfo_t& info, const TreeOpts_t& opts, ToolkitErr_t* err)
{
	ErrCause_t cause;

	/*
	 * Symbolic links are rejected as well, even when pointing to a directory.
	 * Removing the content of a link target would touch paths outside of the
	 * tree we were asked to delete.
	 * */
	if (info.type != IS_DIR) return prv_fail_type(err, path, info.type);

	if (!STK_CAN_WRITE(info)) return prv_fail_access(err, path, info.access);

	std::vector<std::string> names;
	if (ch.list(prv_remote(path), &names, opts.timeout_ms, &cause)) {
		return prv_fail(err, ERR_TAG_LIST_DIR, path, cause);
	}

	for (const std::string& name : names) {
		if (prv_is_dot(name)) continue;

		std::string child = SftpTree::join_path(path, name);
		EntryInfo_t child_info;

		if (ch.stat(child, &child_info, opts.timeout_ms, &cause)) {
			return prv_fail(err, ERR_TAG_FILE_INFO, child, cause);
		}

		if (child_info.type == IS_DIR) {
			if (prv_del_dir(ch, child, child_info, opts, err)) return -1;
			continue;
		}

		LOG_DBG("remove file '%s'\n", child.c_str());

		if (ch.remove_file(child, opts.timeout_ms, &cause)) {
			return prv_fail(err, ERR_TAG_DEL_FILE, child, cause);
		}
	}

	LOG_DBG("remove dir '%s'\n", path.c_str());

	if (ch.remove_dir(prv_remote(path), opts.timeout_ms, &cause)) {
		return prv_fail(err, ERR_TAG_DEL_DIR, path, cause);
	}

	return 0;
}

static int32_t prv_list_dir(RemoteChannel& ch, const std::string& dir,
	const ListOpts_t& opts, ListResult_t* acc, ToolkitErr_t* err)
{
	ErrCause_t               cause;
	std::vector<std::string> names;

	if (ch.list(prv_remote(dir), &names, opts.timeout_ms, &cause)) {
		return prv_fail(err, ERR_TAG_LIST_DIR, dir, cause);
	}

	for (const std::string& name : names) {
		if (prv_is_dot(name)) continue;

		std::string child = SftpTree::join_path(dir, name);

		// ask once per entry, the answer decides whether stat is needed at all
		Decision_t iter = DECIDE_PROCEED;
		if (opts.iterate_cb) iter = opts.iterate_cb(child, opts.user_data);

		if (iter == DECIDE_SKIP) {
			LOG_DBG("iterate skip '%s'\n", child.c_str());
			continue;
		}

		if (iter == DECIDE_SKIP_BUT_INCLUDE) {
			prv_push(acc, opts, child, nullptr);
			continue;
		}

		EntryInfo_t info;
		if (ch.stat(child, &info, opts.timeout_ms, &cause)) {
			return prv_fail(err, ERR_TAG_FILE_INFO, child, cause);
		}

		// no permission to read it, so it does not exist for us
		if (!STK_CAN_READ(info)) {
			LOG_DBG("ignore unreadable '%s'\n", child.c_str());
			continue;
		}

		bool is_included = opts.included_types.contains(info.type);

		if (info.type != IS_DIR) {
			if (is_included) prv_push(acc, opts, child, &info);
			continue;
		}

		Decision_t recurse = DECIDE_PROCEED;
		if (opts.recurse_cb) recurse = opts.recurse_cb(child, opts.user_data);

		switch (recurse) {

		case DECIDE_SKIP: {
			if (is_included) prv_push(acc, opts, child, &info);
			LOG_DBG("recurse skip '%s'\n", child.c_str());
		} break;

		case DECIDE_SKIP_BUT_INCLUDE: {
			prv_push(acc, opts, child, &info);
			LOG_DBG("recurse skip '%s'\n", child.c_str());
		} break;

		case DECIDE_PROCEED: {
			if (is_included) prv_push(acc, opts, child, &info);
			if (prv_list_dir(ch, child, opts, acc, err)) return -1;
		} break;

		default: {
			UNREACHABLE_MSG("unknown recurse decision %d for '%s'\n",
				static_cast<int>(recurse), child.c_str());
		} break;
		}
	}

	return 0;
}

} /* ******************** End of Static Functions *************************** */

/* ************************ API Implementations ***************************** */

std::vector<std::string> SftpTree::split_path(const std::string& path)
{
	std::vector<std::string> comps;

	// keep root as its own component, so "/a/b" resolves "/", "/a", "/a/b"
	if (!path.empty() && path[0] == STK_SEP_CHAR) comps.push_back(STK_SEP);

	size_t start = 0;
	while (start <= path.size()) {
		size_t pos = path.find(STK_SEP_CHAR, start);
		if (pos == std::string::npos) pos = path.size();

		if (pos > start) comps.push_back(path.substr(start, pos - start));

		start = pos + 1;
	}

	return comps;
}

std::string SftpTree::join_path(const std::string& parent, const std::string& name)
{
	if (parent.empty()) return name;
	if (parent.back() == STK_SEP_CHAR) return parent + name;

	return parent + STK_SEP + name;
}

int32_t SftpTree::make_dir_recursive(RemoteChannel& ch,
	const std::string& path, const TreeOpts_t& opts, ToolkitErr_t* err)
{
	/*
	 * SFTP v3 servers answer mkdir on an existing directory with a plain
	 * SSH_FX_FAILURE, which can't be told apart from a real failure. The same
	 * component may also exist as a regular file. So every component is
	 * stat-ed first and mkdir is only issued for the missing ones, at the
	 * cost of one extra round trip per level.
	 * */
	std::string prefix;

	for (const std::string& comp : SftpTree::split_path(path)) {
		prefix = SftpTree::join_path(prefix, comp);

		EntryInfo_t info;
		ErrCause_t  cause;

		if (ch.stat(prefix, &info, opts.timeout_ms, &cause) == 0) {
			if (info.type != IS_DIR) {
				return prv_fail_type(err, prefix, info.type);
			}

			if (!STK_CAN_WRITE(info)) {
				return prv_fail_access(err, prefix, info.access);
			}

			continue;
		}

		if (!SftpErr::is_not_found(cause)) {
			return prv_fail(err, ERR_TAG_FILE_INFO, prefix, cause);
		}

		LOG_DBG("mkdir '%s'\n", prefix.c_str());

		if (ch.mkdir(prefix, opts.timeout_ms, &cause)) {
			return prv_fail(err, ERR_TAG_MAKE_DIR, prefix, cause);
		}
	}

	return 0;
}

int32_t SftpTree::del_dir_recursive(RemoteChannel& ch,
	const std::string& path, const TreeOpts_t& opts, ToolkitErr_t* err)
{
	EntryInfo_t info;
	ErrCause_t  cause;

	if (ch.stat(prv_remote(path), &info, opts.timeout_ms, &cause)) {
		return prv_fail(err, ERR_TAG_FILE_INFO, path, cause);
	}

	return prv_del_dir(ch, path, info, opts, err);
}

int32_t SftpTree::list_dir_recursive(RemoteChannel& ch,
	const std::string& path, const ListOpts_t& opts, ListResult_t* out,
	ToolkitErr_t* err)
{
	if (out) out->clear();

	EntryInfo_t info;
	ErrCause_t  cause;

	if (ch.stat(prv_remote(path), &info, opts.timeout_ms, &cause)) {
		return prv_fail(err, ERR_TAG_FILE_INFO, path, cause);
	}

	if (info.type != IS_DIR) return prv_fail_type(err, path, info.type);

	if (!STK_CAN_READ(info)) return prv_fail_access(err, path, info.access);

	// collect into a local list first, the caller gets all or nothing
	ListResult_t acc;
	if (prv_list_dir(ch, path, opts, &acc, err)) return -1;

	if (out) out->swap(acc);

	return 0;
}
