// include/pushgate/pushgate.hpp
// Umbrella header.

#pragma once

#include "client.hpp"
#include "config.hpp"
#include "error.hpp"
#include "notification.hpp"
#include "payload.hpp"
#include "types.hpp"
