#pragma once

namespace testbox {

/**
 * @brief Resolves a user name on the host
 * @return uid of the user, or -1 when it does not exist
 */
int get_userid(const char *name);

/**
 * @brief Resolves a group name on the host
 * @return gid of the group, or -1 when it does not exist
 */
int get_groupid(const char *name);

}  // namespace testbox
