#include <msgdec/decode/resolver.h>
#include <msgdec/core/config.h>

#include <algorithm>
#include <utility>

namespace msgdec::decode {

const char* parent_kind_name(ParentKind kind) {
    switch (kind) {
        case ParentKind::None:     return "none";
        case ParentKind::Sequence: return "sequence";
        case ParentKind::Map:      return "map";
    }
    return "unknown";
}

ParentContext ParentContext::none() {
    return ParentContext{};
}

ParentContext ParentContext::sequence(Destination container, std::size_t index) {
    ParentContext ctx;
    ctx.kind = ParentKind::Sequence;
    ctx.container = container;
    ctx.index = index;
    return ctx;
}

ParentContext ParentContext::map(Destination container, value::Value key) {
    ParentContext ctx;
    ctx.kind = ParentKind::Map;
    ctx.container = container;
    ctx.key = std::move(key);
    return ctx;
}

// ---------------------------------------------------------------------------
// ResolverFunction
// ---------------------------------------------------------------------------

ResolverFunction::ResolverFunction(Function fn) : fn_(std::move(fn)) {}

value::Value ResolverFunction::resolve(const ParentContext& parent, std::size_t length,
                                       wire::ContainerType type) const {
    if (!fn_) {
        return value::Value();
    }
    return fn_(parent, length, type);
}

// ---------------------------------------------------------------------------
// SimpleContainerResolver
// ---------------------------------------------------------------------------

SimpleContainerResolver::SimpleContainerResolver() = default;

SimpleContainerResolver::SimpleContainerResolver(ResolverOptions options)
    : options_(std::move(options)) {}

bool SimpleContainerResolver::bytes_as_string(ParentKind parent) const {
    switch (parent) {
        case ParentKind::None:     return options_.bytes_as_string_top_level;
        case ParentKind::Sequence: return options_.bytes_as_string_in_sequence;
        case ParentKind::Map:      return options_.bytes_as_string_in_map;
    }
    return options_.bytes_as_string_top_level;
}

value::Value SimpleContainerResolver::resolve(const ParentContext& parent, std::size_t length,
                                              wire::ContainerType type) const {
    switch (type) {
        case wire::ContainerType::Map:
            if (options_.map_shape) {
                return options_.map_shape(length);
            }
            return value::Value(value::Value::Map{});
        case wire::ContainerType::Sequence:
            if (options_.sequence_shape) {
                return options_.sequence_shape(length);
            }
            {
                value::Value::Sequence elements;
                elements.reserve(std::min(length, core::config::kMaxPreallocatedElements));
                return value::Value(std::move(elements));
            }
        case wire::ContainerType::RawBytes:
            if (bytes_as_string(parent.kind)) {
                return value::Value(std::string());
            }
            return value::Value(value::Value::Bytes());
    }
    return value::Value();
}

std::shared_ptr<const ContainerResolver> default_resolver() {
    static const std::shared_ptr<const ContainerResolver> instance =
        std::make_shared<SimpleContainerResolver>();
    return instance;
}

}  // namespace msgdec::decode
