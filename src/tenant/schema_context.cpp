#include "tenant/schema_context.hpp"
#include "tenant/tenant_registry.hpp"
#include "core/utils.hpp"

namespace pgtenant {

std::optional<std::string> SchemaContext::current() const {
    if (stack_.empty()) {
        return std::nullopt;
    }
    return stack_.back();
}

void SchemaContext::push(std::string schema_name) {
    stack_.push_back(std::move(schema_name));
}

bool SchemaContext::pop() {
    if (stack_.empty()) {
        utils::log::warn("SchemaContext::pop on empty stack");
        return false;
    }
    stack_.pop_back();
    return true;
}

ScopedSchema::ScopedSchema(SchemaContext& context, std::string schema_name)
    : context_(&context) {
    context_->push(std::move(schema_name));
}

ScopedSchema::~ScopedSchema() {
    if (context_) {
        context_->pop();
    }
}

ScopedSchema::ScopedSchema(ScopedSchema&& other) noexcept
    : context_(other.context_) {
    other.context_ = nullptr;
}

Result<ScopedSchema> activate_tenant(SchemaContext& context,
                                     const TenantRegistry& registry,
                                     const std::string& identifier) {
    auto schema = registry.lookup(identifier);
    if (schema.is_error()) {
        return Result<ScopedSchema>::from_error(schema);
    }
    return Result<ScopedSchema>::ok(ScopedSchema(context, std::move(schema.value())));
}

} // namespace pgtenant
