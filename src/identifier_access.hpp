// src/identifier_access.hpp
// Internal write access to Notification::identifier_.

#pragma once

#include "pushgate/notification.hpp"
#include <cstdint>

namespace pushgate {
namespace detail {

struct IdentifierAccess {
    static void assign(Notification& notification, int32_t identifier) noexcept {
        notification.identifier_ = identifier;
    }
};

} // namespace detail
} // namespace pushgate
