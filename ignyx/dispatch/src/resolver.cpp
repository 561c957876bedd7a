#include "ignyx/resolver.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "ignyx/arguments.hpp"
#include "ignyx/errors.hpp"
#include "ignyx/handler-descriptor.hpp"
#include "ignyx/http-constants.hpp"
#include "ignyx/http-request.hpp"
#include "ignyx/json.hpp"
#include "ignyx/multipart-form-data.hpp"
#include "ignyx/param-spec.hpp"
#include "ignyx/shape.hpp"
#include "ignyx/string-equal-ignore-case.hpp"
#include "ignyx/string-trim.hpp"
#include "ignyx/url-decode.hpp"
#include "ignyx/vector.hpp"

namespace ignyx {

namespace {

// Form fields of a request body, whatever its encoding.
struct FormFields {
  struct Field {
    std::string name;
    std::string value;
    std::optional<std::string> filename;
    std::string contentType;
  };

  vector<Field> fields;
};

std::string_view MediaType(std::string_view contentType) {
  return Trim(contentType.substr(0, contentType.find(';')), kOws);
}

FormFields ParseForm(const HttpRequest& request) {
  FormFields form;
  const std::string_view contentType = request.headerValueOrEmpty(http::ContentType);
  const std::string_view mediaType = MediaType(contentType);
  if (CaseInsensitiveEqual(mediaType, http::ContentTypeFormUrlEncoded)) {
    for (auto& [key, value] : url::ParseQueryString(request.body())) {
      form.fields.push_back(FormFields::Field{std::move(key), std::move(value), std::nullopt, {}});
    }
  } else if (CaseInsensitiveEqual(mediaType, http::ContentTypeMultipartFormData)) {
    MultipartFormData multipart(contentType, request.body());
    for (const MultipartFormData::Part& part : multipart.parts()) {
      FormFields::Field field{std::string(part.name), std::string(part.value), std::nullopt, {}};
      if (part.filename) {
        field.filename.emplace(*part.filename);
      }
      field.contentType = std::string(part.contentType.value_or(http::ContentTypeTextPlain));
      form.fields.push_back(std::move(field));
    }
  }
  return form;
}

class ParamResolver {
 public:
  ParamResolver(const HandlerDescriptor& descriptor, const HttpRequest& request, Arguments& args)
      : _descriptor(descriptor), _request(request), _args(args) {}

  void run() {
    for (const ParamSpec& spec : _descriptor.params()) {
      switch (spec.source) {
        case ParamSource::Path:
          resolvePath(spec);
          break;
        case ParamSource::Query:
          resolveText(spec, collectQuery(spec));
          break;
        case ParamSource::Header:
          resolveText(spec, collectHeader(spec));
          break;
        case ParamSource::Cookie:
          resolveText(spec, collectCookie(spec));
          break;
        case ParamSource::Form:
          resolveForm(spec);
          break;
        case ParamSource::Body:
          resolveBody(spec);
          break;
        default:
          break;
      }
    }
    if (!_errors.empty()) {
      throw ValidationError(std::move(_errors));
    }
  }

 private:
  vector<LocPart> locOf(const ParamSpec& spec) const {
    vector<LocPart> loc;
    loc.emplace_back(std::string(ParamSourceLocation(spec.source)));
    loc.emplace_back(std::string(spec.wireName()));
    return loc;
  }

  void setDefaultOrMissing(const ParamSpec& spec, vector<LocPart> loc) {
    if (spec.required) {
      _errors.push_back(MakeFieldError({loc.data(), loc.size()}, errtype::kMissing, Json{}));
      return;
    }
    _args.set(spec.name, ToParamValue(spec.defaultValue, spec.shape));
  }

  vector<std::string_view> collectQuery(const ParamSpec& spec) const {
    vector<std::string_view> values;
    for (const QueryParam& param : _request.queryParams()) {
      if (param.key == spec.wireName()) {
        values.push_back(param.value);
      }
    }
    return values;
  }

  vector<std::string_view> collectHeader(const ParamSpec& spec) const { return _request.headers().getAll(spec.wireName()); }

  vector<std::string_view> collectCookie(const ParamSpec& spec) const {
    vector<std::string_view> values;
    if (auto value = _request.cookieValue(spec.wireName())) {
      values.push_back(*value);
    }
    return values;
  }

  void resolvePath(const ParamSpec& spec) {
    const auto loc = locOf(spec);
    auto raw = _request.pathParamValue(spec.wireName());
    if (!raw) {
      setDefaultOrMissing(spec, loc);
      return;
    }
    if (auto value = CoerceParam(*raw, spec.shape, {loc.data(), loc.size()}, _errors)) {
      _args.set(spec.name, std::move(*value));
    }
  }

  // Repeated values feed array shapes, the last occurrence wins for scalars.
  void resolveText(const ParamSpec& spec, const vector<std::string_view>& values) {
    vector<LocPart> loc = locOf(spec);
    if (values.empty()) {
      setDefaultOrMissing(spec, std::move(loc));
      return;
    }
    if (spec.shape.kind() != Shape::Kind::Array) {
      if (auto value = CoerceParam(values.back(), spec.shape, {loc.data(), loc.size()}, _errors)) {
        _args.set(spec.name, std::move(*value));
      }
      return;
    }
    Json array = JsonArray();
    bool allValid = true;
    for (std::size_t pos = 0; pos < values.size(); ++pos) {
      loc.emplace_back(static_cast<int64_t>(pos));
      if (auto value = CoerceText(values[pos], spec.shape.element(), {loc.data(), loc.size()}, _errors)) {
        array.get_array().push_back(std::move(*value));
      } else {
        allValid = false;
      }
      loc.pop_back();
    }
    if (allValid) {
      _args.set(spec.name, std::move(array));
    }
  }

  void resolveForm(const ParamSpec& spec) {
    if (!_form) {
      _form.emplace(ParseForm(_request));
    }
    if (spec.shape.kind() == Shape::Kind::File) {
      for (const FormFields::Field& field : _form->fields) {
        if (field.name == spec.wireName() && field.filename) {
          _args.set(spec.name, UploadFile{*field.filename, field.contentType, field.value});
          return;
        }
      }
      setDefaultOrMissing(spec, locOf(spec));
      return;
    }
    vector<std::string_view> values;
    for (const FormFields::Field& field : _form->fields) {
      if (field.name == spec.wireName()) {
        values.push_back(field.value);
      }
    }
    resolveText(spec, values);
  }

  // Parses the body once. Returns nullptr if it is absent or invalid (the error is recorded once).
  const Json* bodyDocument() {
    if (!_bodyParsed) {
      _bodyParsed = true;
      const std::string_view body = _request.body();
      if (!Trim(body).empty()) {
        _body = ParseJson(body);
        if (!_body) {
          vector<LocPart> loc;
          loc.emplace_back(std::string("body"));
          _errors.push_back(MakeFieldError({loc.data(), loc.size()}, errtype::kJsonInvalid, Json(std::string(body))));
          _bodyInvalid = true;
        }
      }
    }
    return _body ? &*_body : nullptr;
  }

  void resolveBody(const ParamSpec& spec) {
    const Json* document = bodyDocument();
    if (_bodyInvalid) {
      return;
    }
    vector<LocPart> loc;
    loc.emplace_back(std::string("body"));
    const Json* input = document;
    if (_descriptor.embedsBody()) {
      loc.emplace_back(std::string(spec.wireName()));
      input = nullptr;
      if (document != nullptr) {
        if (!document->is_object()) {
          if (!_bodyShapeReported) {
            _bodyShapeReported = true;
            vector<LocPart> bodyLoc;
            bodyLoc.emplace_back(std::string("body"));
            _errors.push_back(MakeFieldError({bodyLoc.data(), bodyLoc.size()}, errtype::kDictType, *document));
          }
          return;
        }
        const auto& members = document->get_object();
        if (auto it = members.find(std::string(spec.wireName())); it != members.end()) {
          input = &it->second;
        }
      }
    }
    if (input == nullptr || (input->is_null() && !spec.required)) {
      setDefaultOrMissing(spec, std::move(loc));
      return;
    }
    if (auto value = ValidateJson(*input, spec.shape, loc, _errors)) {
      _args.set(spec.name, ToParamValue(std::move(*value), spec.shape));
    }
  }

  const HandlerDescriptor& _descriptor;
  const HttpRequest& _request;
  Arguments& _args;
  vector<FieldError> _errors;
  std::optional<FormFields> _form;
  std::optional<Json> _body;
  bool _bodyParsed{false};
  bool _bodyInvalid{false};
  bool _bodyShapeReported{false};
};

}  // namespace

void ResolveParameters(const HandlerDescriptor& descriptor, const HttpRequest& request, Arguments& args) {
  ParamResolver(descriptor, request, args).run();
}

}  // namespace ignyx
