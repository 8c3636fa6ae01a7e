#pragma once

#include "xlbind/core/ErrorCode.hpp"
#include <type_traits>
#include <utility>
#include <variant>

namespace xlbind {
namespace core {

/**
 * @brief Expected<T, E> - 非抛出通道的返回类型
 *
 * 与异常通道使用同一套ErrorCode：try*系列接口把捕获的异常转换为Error返回，
 * 调用方可以在不想处理异常的路径（例如批量探测文档是否存在）上使用。
 */
template<typename T, typename E = Error>
class Expected {
    static_assert(!std::is_same_v<T, E>, "value and error types must differ");

public:
    using value_type = T;
    using error_type = E;

    Expected(const T& value) : storage_(std::in_place_index<0>, value) {}
    Expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

    Expected(const E& error) : storage_(std::in_place_index<1>, error) {}
    Expected(E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    bool hasValue() const noexcept { return storage_.index() == 0; }
    bool hasError() const noexcept { return storage_.index() == 1; }

    explicit operator bool() const noexcept { return hasValue(); }

    /**
     * @brief 获取值；持有错误时抛出 std::bad_variant_access
     */
    T& value() & { return std::get<0>(storage_); }
    const T& value() const & { return std::get<0>(storage_); }
    T&& value() && { return std::get<0>(std::move(storage_)); }

    E& error() & { return std::get<1>(storage_); }
    const E& error() const & { return std::get<1>(storage_); }

    T valueOr(T default_value) const & {
        return hasValue() ? std::get<0>(storage_) : std::move(default_value);
    }

    T& operator*() & { return value(); }
    const T& operator*() const & { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    /**
     * @brief 成功时映射值，失败时透传错误
     */
    template<typename F>
    auto map(F&& func) const -> Expected<std::decay_t<decltype(func(std::declval<const T&>()))>, E> {
        using U = std::decay_t<decltype(func(std::declval<const T&>()))>;
        if (hasValue()) {
            return Expected<U, E>(func(value()));
        }
        return Expected<U, E>(error());
    }

private:
    std::variant<T, E> storage_;
};

template<typename T>
Expected<std::decay_t<T>> makeExpected(T&& value) {
    return Expected<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
Expected<T> makeUnexpected(ErrorCode code, const std::string& message) {
    return Expected<T>(Error(code, message));
}

}} // namespace xlbind::core
