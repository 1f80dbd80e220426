#pragma once

// Include from exactly one translation unit to compile the iocoro runtime sources.
#include <wscoro/wscoro.hpp>

#include <iocoro/impl.hpp>
