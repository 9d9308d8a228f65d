#include <evergreen/InstanceStaging.hpp>
#include <evergreen/Logger.hpp>
#include <evergreen/Transform.hpp>
#include <cassert>

namespace evergreen {

GpuInstance& InstanceRange::at(uint32_t index) {
    assert(m_owner != nullptr && index < m_count);
    return m_owner->m_records[m_first + index];
}

void InstanceRange::set_transform(uint32_t index, const InstanceTransform& transform) {
    at(index).model = model_matrix(transform);
}

void InstanceRange::set_color(uint32_t index, const glm::vec3& color) {
    auto& record = at(index);
    record.color = glm::vec4(color, record.color.a);
}

void InstanceRange::set_emission(uint32_t index, float strength) {
    at(index).color.a = strength;
}

void InstanceRange::set_model(uint32_t index, const glm::mat4& model) {
    at(index).model = model;
}

InstanceRange InstanceStaging::allocate(std::string name, uint32_t count) {
    auto first = size();
    m_records.resize(m_records.size() + count);
    Logger::instance().debug("Instance range '{}' at [{}, {})", name, first, first + count);
    return InstanceRange(this, std::move(name), first, count);
}

} // namespace evergreen
