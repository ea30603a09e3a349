#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace observability {

using FieldValue = std::variant<std::string, int64_t, double>;
// ordered, so a record's fields always come out in the same order
using Fields = std::map<std::string, FieldValue>;

void log_debug(const std::string& msg, const Fields& fields = {});
void log_info(const std::string& msg, const Fields& fields = {});
void log_warn(const std::string& msg, const Fields& fields = {});
void log_error(const std::string& msg, const Fields& fields = {});

// 1=DEBUG 2=INFO 3=WARN 4=ERROR; records below the threshold are dropped
void set_log_level(int level);
bool log_enabled(int level);

}
