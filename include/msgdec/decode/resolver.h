#pragma once
#include <msgdec/core/config.h>
#include <msgdec/decode/destination.h>
#include <msgdec/value/value.h>
#include <msgdec/wire/format.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace msgdec::decode {

enum class ParentKind {
    None,
    Sequence,
    Map,
};

const char* parent_kind_name(ParentKind kind);

// Where an open slot sits. Set for direct elements of a sequence and for
// values of a map; None at the root, for record fields, behind pointers and
// inside boxed objects.
struct ParentContext {
    ParentKind kind = ParentKind::None;
    Destination container;
    std::optional<std::size_t> index;
    value::Value key;

    static ParentContext none();
    static ParentContext sequence(Destination container, std::size_t index);
    static ParentContext map(Destination container, value::Value key);
};

// Materializes a concrete value for an open slot that met a container tag.
// The returned Value must be able to hold the container: a String or Bytes
// for RawBytes, a Sequence for Sequence, a Map for Map, or a Record whose
// boxed object decodes that shape. Implementations are shared across
// decoders and must be safe for concurrent calls.
class ContainerResolver {
public:
    virtual ~ContainerResolver() = default;
    virtual value::Value resolve(const ParentContext& parent, std::size_t length,
                                 wire::ContainerType type) const = 0;
};

class ResolverFunction : public ContainerResolver {
public:
    using Function = std::function<value::Value(const ParentContext&, std::size_t,
                                                wire::ContainerType)>;

    explicit ResolverFunction(Function fn);

    value::Value resolve(const ParentContext& parent, std::size_t length,
                         wire::ContainerType type) const override;

private:
    Function fn_;
};

struct ResolverOptions {
    bool bytes_as_string_top_level = core::config::kDefaultBytesAsStringTopLevel;
    bool bytes_as_string_in_sequence = core::config::kDefaultBytesAsStringInSequence;
    bool bytes_as_string_in_map = core::config::kDefaultBytesAsStringInMap;

    // Optional concrete shapes, called with the wire length. Unset means a
    // generic Map / Sequence of open values.
    std::function<value::Value(std::size_t)> map_shape;
    std::function<value::Value(std::size_t)> sequence_shape;
};

class SimpleContainerResolver : public ContainerResolver {
public:
    SimpleContainerResolver();
    explicit SimpleContainerResolver(ResolverOptions options);

    value::Value resolve(const ParentContext& parent, std::size_t length,
                         wire::ContainerType type) const override;

    const ResolverOptions& options() const { return options_; }

    // Flag that applies to raw bytes under the given parent.
    bool bytes_as_string(ParentKind parent) const;

private:
    ResolverOptions options_;
};

// Process-wide immutable resolver with the default options.
std::shared_ptr<const ContainerResolver> default_resolver();

}  // namespace msgdec::decode
