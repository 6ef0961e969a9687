#include "kubeclient/resource/patch_document.hpp"

#include <glaze/json.hpp>

namespace kubeclient {

namespace detail {

struct PatchOperationJson {
  std::string op;
  std::string path;
  std::optional<std::string> from;
  std::optional<glz::raw_json> value;
};

} // namespace detail

} // namespace kubeclient

namespace glz {

template <> struct meta<kubeclient::detail::PatchOperationJson> {
  using T = kubeclient::detail::PatchOperationJson;
  static constexpr auto value =
      object("op", &T::op, "path", &T::path, "from", &T::from, "value",
             &T::value);
};

} // namespace glz

namespace kubeclient {

auto escape_pointer_token(std::string_view token) -> std::string {
  std::string out;
  out.reserve(token.size());
  for (char c : token) {
    if (c == '~') {
      out.append("~0");
    } else if (c == '/') {
      out.append("~1");
    } else {
      out.push_back(c);
    }
  }
  return out;
}

auto json_pointer(std::initializer_list<std::string_view> tokens)
    -> std::string {
  std::string out;
  for (auto token : tokens) {
    out.push_back('/');
    out.append(escape_pointer_token(token));
  }
  return out;
}

auto PatchDocument::push_value(PatchOp op, std::string path,
                               Result<std::string> value) -> PatchDocument & {
  if (!value) {
    if (!error_) {
      error_ = value.error();
    }
    return *this;
  }
  operations_.push_back(PatchOperation{.op = op,
                                       .path = std::move(path),
                                       .from = std::nullopt,
                                       .value_json = std::move(*value)});
  return *this;
}

auto PatchDocument::push_raw(PatchOp op, std::string path,
                             std::string value_json) -> PatchDocument & {
  if (!parse_json(value_json)) {
    if (!error_) {
      error_ = make_error_code(Error::InvalidArgument);
    }
    return *this;
  }
  return push_value(op, std::move(path), ok(std::move(value_json)));
}

auto PatchDocument::add_json(std::string path, std::string value_json)
    -> PatchDocument & {
  return push_raw(PatchOp::Add, std::move(path), std::move(value_json));
}

auto PatchDocument::replace_json(std::string path, std::string value_json)
    -> PatchDocument & {
  return push_raw(PatchOp::Replace, std::move(path), std::move(value_json));
}

auto PatchDocument::test_json(std::string path, std::string value_json)
    -> PatchDocument & {
  return push_raw(PatchOp::Test, std::move(path), std::move(value_json));
}

auto PatchDocument::remove(std::string path) -> PatchDocument & {
  operations_.push_back(PatchOperation{.op = PatchOp::Remove,
                                       .path = std::move(path),
                                       .from = std::nullopt,
                                       .value_json = std::nullopt});
  return *this;
}

auto PatchDocument::move(std::string from, std::string path)
    -> PatchDocument & {
  operations_.push_back(PatchOperation{.op = PatchOp::Move,
                                       .path = std::move(path),
                                       .from = std::move(from),
                                       .value_json = std::nullopt});
  return *this;
}

auto PatchDocument::copy(std::string from, std::string path)
    -> PatchDocument & {
  operations_.push_back(PatchOperation{.op = PatchOp::Copy,
                                       .path = std::move(path),
                                       .from = std::move(from),
                                       .value_json = std::nullopt});
  return *this;
}

auto PatchDocument::serialize() const -> Result<std::string> {
  if (error_) {
    return fail(error_);
  }
  std::vector<detail::PatchOperationJson> wire;
  wire.reserve(operations_.size());
  for (const auto &operation : operations_) {
    detail::PatchOperationJson entry{
        .op = std::string(to_string_view(operation.op)),
        .path = operation.path,
        .from = operation.from,
        .value = std::nullopt};
    if (operation.value_json) {
      entry.value = glz::raw_json{*operation.value_json};
    }
    wire.push_back(std::move(entry));
  }
  return write_json(wire);
}

} // namespace kubeclient
