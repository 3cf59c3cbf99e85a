// SPDX-License-Identifier: Apache-2.0
#include "RouterScope.hpp"

#include <core/Log.hpp>

namespace mcprouter
{

RouterScope::RouterScope(Router& router): _router(&router)
{
}

RouterScope::~RouterScope()
{
    if (auto result = release(); !result)
        log::error("Shutdown on scope exit: {}", result.error().message);
}

auto RouterScope::release() -> VoidResult
{
    if (_released)
        return {};

    _released = true;
    return _router->shutdown();
}

} // namespace mcprouter
