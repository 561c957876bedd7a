#include "ignyx/exception-handlers.hpp"

#include <exception>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>

#include "ignyx/demangle.hpp"
#include "ignyx/errors.hpp"
#include "ignyx/http-constants.hpp"
#include "ignyx/http-method.hpp"
#include "ignyx/http-response.hpp"
#include "ignyx/http-status-code.hpp"
#include "ignyx/json.hpp"
#include "ignyx/log.hpp"
#include "ignyx/marshal.hpp"

namespace ignyx {

namespace {

// Appends "<type>: <what>" for 'ex' and every exception nested in it.
void AppendTraceback(const std::exception& ex, Json& traceback) {
  traceback.get_array().emplace_back(DemangledName(typeid(ex)) + ": " + ex.what());
  try {
    std::rethrow_if_nested(ex);
  } catch (const std::exception& nested) {
    AppendTraceback(nested, traceback);
  } catch (...) {
    traceback.get_array().emplace_back(std::string("non standard exception"));
  }
}

}  // namespace

void ExceptionHandlers::addStatus(http::StatusCode status, ExceptionHandler handler) {
  _statusHandlers[status] = std::move(handler);
}

std::optional<HttpResponse> ExceptionHandlers::userResponse(const HttpRequest& request,
                                                            const std::exception& ex) const {
  const std::type_index dynamicType(typeid(ex));
  for (const TypeEntry& entry : _typeHandlers) {
    if (entry.type == dynamicType) {
      return entry.tryHandle(request, ex);
    }
  }
  for (const TypeEntry& entry : _typeHandlers) {
    if (auto response = entry.tryHandle(request, ex)) {
      return response;
    }
  }
  auto it = _statusHandlers.find(StatusOf(ex));
  if (it != _statusHandlers.end()) {
    return it->second(request, ex);
  }
  return std::nullopt;
}

HttpResponse ExceptionHandlers::handle(const HttpRequest& request, std::exception_ptr error) const {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& ex) {
    try {
      if (auto response = userResponse(request, ex)) {
        return std::move(*response);
      }
    } catch (const std::exception& handlerError) {
      log::error("Exception handler for {} failed with {}: {}", DemangledName(typeid(ex)),
                 DemangledName(typeid(handlerError)), handlerError.what());
      return DefaultResponse(handlerError, _debug);
    }
    if (StatusOf(ex) == http::StatusCodeInternalServerError) {
      log::error("Unhandled {} on {} {}: {}", DemangledName(typeid(ex)), http::MethodToStr(request.method()),
                 request.path(), ex.what());
    }
    return DefaultResponse(ex, _debug);
  }
}

HttpResponse ExceptionHandlers::DefaultResponse(const std::exception& ex, bool debug) {
  if (const auto* httpException = dynamic_cast<const HttpException*>(&ex)) {
    HttpResponse response = DetailResponse(httpException->status(), Json(std::string(httpException->detail())));
    for (const auto& [name, value] : httpException->headers().entries()) {
      response.header(name, value);
    }
    return response;
  }
  if (const auto* validationError = dynamic_cast<const ValidationError*>(&ex)) {
    return HttpResponse(http::StatusCodeUnprocessableEntity, DumpJson(validationError->toJson()),
                        http::ContentTypeApplicationJson);
  }
  if (dynamic_cast<const LockTimeout*>(&ex) != nullptr) {
    return DetailResponse(http::StatusCodeServiceUnavailable, Json(std::string("Service Unavailable")));
  }
  if (!debug) {
    return DetailResponse(http::StatusCodeInternalServerError, Json(std::string("Internal Server Error")));
  }
  Json body = JsonObject();
  body["detail"] = std::string(ex.what());
  body["error"] = DemangledName(typeid(ex));
  Json traceback = JsonArray();
  AppendTraceback(ex, traceback);
  body["traceback"] = std::move(traceback);
  return HttpResponse(http::StatusCodeInternalServerError, DumpJson(body), http::ContentTypeApplicationJson);
}

}  // namespace ignyx
