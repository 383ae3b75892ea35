#include <msgdec/decode/field_map.h>

#include <algorithm>

namespace msgdec::decode {

void FieldMap::add(FieldBinding binding) {
    std::string name = binding.name;
    fields_.insert_or_assign(std::move(name), std::move(binding));
}

const FieldBinding* FieldMap::find(std::string_view name) const {
    auto it = fields_.find(std::string(name));
    if (it == fields_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> FieldMap::names() const {
    std::vector<std::string> result;
    result.reserve(fields_.size());
    for (const auto& [name, binding] : fields_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

FieldRegistry& FieldRegistry::global() {
    static FieldRegistry instance;
    return instance;
}

std::size_t FieldRegistry::size() const {
    std::shared_lock lock(mutex_);
    return maps_.size();
}

std::size_t FieldRegistry::build_count() const {
    std::shared_lock lock(mutex_);
    return builds_;
}

}  // namespace msgdec::decode
