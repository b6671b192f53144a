#include "transport.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

std::string endpoint_base_name(const std::string& app_id) {
    std::string user = sanitize_identifier(platform::user_token());
    if (user.empty()) user = "default";
    return fmt::format("{}{}_{}", ENDPOINT_PREFIX, sanitize_identifier(app_id), user);
}
