#pragma once
/**
 * @file property.h
 * @brief Time-dynamic reactive values
 *
 * A Property<T> produces a value for a given JulianDate and raises
 * definition_changed() whenever the values it would produce change for
 * reasons other than the passage of time.
 */

#include "geoclamp/core/time.h"
#include "geoclamp/events/event.h"
#include <functional>
#include <memory>
#include <optional>
#include <utility>

namespace geoclamp::datasources {

using core::JulianDate;

// ============================================================================
// Property Interface
// ============================================================================

template<typename T>
class Property {
public:
    using ValueType = T;

    virtual ~Property() = default;

    /**
     * @brief Value at the given time, or nullopt when undefined
     */
    virtual std::optional<T> get_value(const JulianDate& time) = 0;

    /**
     * @brief True if get_value() returns the same value for every time
     */
    virtual bool is_constant() const = 0;

    /**
     * @brief Raised whenever the definition of this property changes
     */
    virtual events::Event<>& definition_changed() = 0;

    /**
     * @brief Structural equality
     */
    virtual bool equals(const Property<T>& other) const = 0;
};

// ============================================================================
// Constant Property
// ============================================================================

/**
 * @brief Property whose value does not vary with time
 */
template<typename T>
class ConstantProperty : public Property<T> {
public:
    ConstantProperty() = default;
    explicit ConstantProperty(std::optional<T> value) : value_(std::move(value)) {}

    static std::shared_ptr<ConstantProperty<T>> create(std::optional<T> value) {
        return std::make_shared<ConstantProperty<T>>(std::move(value));
    }

    std::optional<T> get_value(const JulianDate&) override { return value_; }

    bool is_constant() const override { return true; }

    events::Event<>& definition_changed() override { return definition_changed_; }

    /**
     * @brief Replace the value; raises definition_changed() if it differs
     */
    void set_value(std::optional<T> value) {
        if (value_ == value) {
            return;
        }
        value_ = std::move(value);
        definition_changed_.raise();
    }

    const std::optional<T>& value() const { return value_; }

    bool equals(const Property<T>& other) const override {
        if (this == &other) {
            return true;
        }
        auto* constant = dynamic_cast<const ConstantProperty<T>*>(&other);
        return constant != nullptr && constant->value_ == value_;
    }

private:
    std::optional<T> value_;
    events::Event<> definition_changed_;
};

// ============================================================================
// Callback Property
// ============================================================================

/**
 * @brief Property whose value is computed by a function of time
 */
template<typename T>
class CallbackProperty : public Property<T> {
public:
    using Callback = std::function<std::optional<T>(const JulianDate&)>;

    CallbackProperty(Callback callback, bool constant)
        : callback_(std::move(callback)), constant_(constant) {}

    std::optional<T> get_value(const JulianDate& time) override {
        return callback_ ? callback_(time) : std::nullopt;
    }

    bool is_constant() const override { return constant_; }

    events::Event<>& definition_changed() override { return definition_changed_; }

    /**
     * @brief Replace the callback; always raises definition_changed()
     */
    void set_callback(Callback callback, bool constant) {
        callback_ = std::move(callback);
        constant_ = constant;
        definition_changed_.raise();
    }

    bool equals(const Property<T>& other) const override {
        return this == &other;
    }

private:
    Callback callback_;
    bool constant_{false};
    events::Event<> definition_changed_;
};

// ============================================================================
// Helpers
// ============================================================================

namespace property {

/**
 * @brief Evaluate an optional property, falling back to a default
 *
 * The default is used when the property is absent or undefined at time.
 */
template<typename T>
T get_value_or_default(Property<T>* prop, const JulianDate& time, const T& default_value) {
    if (prop == nullptr) {
        return default_value;
    }
    std::optional<T> value = prop->get_value(time);
    return value ? *value : default_value;
}

/**
 * @brief Equality for nullable properties
 */
template<typename T>
bool equals(const Property<T>* left, const Property<T>* right) {
    return left == right ||
           (left != nullptr && right != nullptr && left->equals(*right));
}

} // namespace property

} // namespace geoclamp::datasources
