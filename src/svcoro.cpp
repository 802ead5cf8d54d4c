#include <svcoro/src.hpp>
