#ifndef _SFTP_TREE_HPP
#define _SFTP_TREE_HPP

#include "remote_channel.hpp"
#include "sftp_err.hpp"
#include "sftp_toolkit.hpp"

#include <cstdint>
#include <string>
#include <vector>

/*
 * Directory tree operations built from single level SFTP requests.
 *
 * All functions return 0 on success and -1 on failure, in which case @p err
 * (when not null) describes the first step that failed. Nothing is rolled
 * back: whatever was created or removed before the failure stays that way.
 * */
namespace SftpTree {

/**
 * Create @p path and all its missing parents. Existing components must be
 * writable directories. Symbolic links are never followed, a link found
 * among the components is an invalid_type error.
 * */
int32_t make_dir_recursive(RemoteChannel& ch, const std::string& path,
	const TreeOpts_t& opts, ToolkitErr_t* err);

/** Remove directory @p path with all its contents */
int32_t del_dir_recursive(RemoteChannel& ch, const std::string& path,
	const TreeOpts_t& opts, ToolkitErr_t* err);

/**
 * Walk the tree under @p path depth-first, pre-order. Entries without read
 * access are silently ignored and so are the subtrees of unreadable
 * directories. On failure @p out is left empty.
 * */
int32_t list_dir_recursive(RemoteChannel& ch, const std::string& path,
	const ListOpts_t& opts, ListResult_t* out, ToolkitErr_t* err);

std::vector<std::string> split_path(const std::string& path);
std::string join_path(const std::string& parent, const std::string& name);

}

#endif
