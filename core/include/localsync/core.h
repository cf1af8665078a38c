#pragma once

namespace LocalSync {

constexpr const char* VERSION = "0.1.0";
constexpr const char* DEFAULT_APP_NAME = "localsync";
constexpr const char* DEFAULT_DB_FILE_NAME = "local.db";

} // namespace LocalSync
