#pragma once

// Out-of-line definitions. Include from exactly one translation unit.

#include <svcoro/impl/assert.ipp>
#include <svcoro/impl/error.ipp>

#include <svcoro/impl/executor.ipp>
#include <svcoro/impl/io_context_impl.ipp>

#include <svcoro/impl/steady_timer.ipp>

#include <svcoro/impl/log.ipp>
