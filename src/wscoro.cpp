#include <wscoro/src.hpp>
