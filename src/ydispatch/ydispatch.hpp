#pragma once

// ydispatch - in-process publish/subscribe event dispatcher

#include "result.hpp"
#include "types.hpp"
#include "object.hpp"
#include "id_generator.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "error_log.hpp"
#include "event.hpp"
#include "handler.hpp"
#include "subscription.hpp"
#include "registry.hpp"
#include "notification.hpp"
#include "dispatcher.hpp"
