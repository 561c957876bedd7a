#pragma once

#include "ignyx/arguments.hpp"
#include "ignyx/handler-descriptor.hpp"
#include "ignyx/http-request.hpp"

namespace ignyx {

// Resolves the path, query, header, cookie, body and form parameters of 'descriptor' from 'request' into 'args'.
// Every parameter is processed: if at least one of them is invalid, throws a ValidationError carrying all the
// errors found. Dependency and context parameters are left to the caller.
void ResolveParameters(const HandlerDescriptor& descriptor, const HttpRequest& request, Arguments& args);

}  // namespace ignyx
