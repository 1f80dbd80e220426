#pragma once

#include <wscoro/backend.hpp>
#include <wscoro/channel.hpp>
#include <wscoro/client.hpp>
#include <wscoro/close_code.hpp>
#include <wscoro/config.hpp>
#include <wscoro/delegate.hpp>
#include <wscoro/error.hpp>
#include <wscoro/error_info.hpp>
#include <wscoro/event.hpp>
#include <wscoro/expected.hpp>
#include <wscoro/frame.hpp>
#include <wscoro/logger.hpp>
#include <wscoro/network_path.hpp>
#include <wscoro/network_watcher.hpp>
#include <wscoro/path_monitor.hpp>
#include <wscoro/reconnect_strategy.hpp>
#include <wscoro/request.hpp>
#include <wscoro/status.hpp>
#include <wscoro/timer.hpp>
#include <wscoro/version.hpp>
