#ifndef PSA_CORE_RESULT_H
#define PSA_CORE_RESULT_H

#include "psa/core/error.h"
#include <variant>
#include <stdexcept>
#include <type_traits>

namespace psa::core {

    /**
     * @brief Outcome of an operation that either produces a value or fails with an Error.
     *
     * Every recoverable failure in the analyzer travels through this type; exceptions
     * are reserved for programming errors such as reading the value of a failed result.
     *
     * @tparam T The type of the successful result value.
     */
    template<typename T>
    class Result {
    public:
        explicit Result(const T& value) : data_(value) {}
        explicit Result(T&& value) : data_(std::move(value)) {}
        explicit Result(const Error& error) : data_(error) {}
        explicit Result(Error&& error) : data_(std::move(error)) {}

        static Result success(const T& value) { return Result(value); }
        static Result success(T&& value) { return Result(std::move(value)); }
        static Result failure(const Error& error) { return Result(error); }
        static Result failure(Error&& error) { return Result(std::move(error)); }

        /// Creates a failed result from an error code and message.
        static Result failure(const ErrorCode code, std::string message) {
            return Result(make_error(code, std::move(message)));
        }

        [[nodiscard]] bool is_success() const { return std::holds_alternative<T>(data_); }
        [[nodiscard]] bool is_failure() const { return std::holds_alternative<Error>(data_); }
        explicit operator bool() const { return is_success(); }

        /// @return The contained value, or throws if this is a failure.
        const T& value() const & {
            if (!is_success()) throw std::runtime_error("Accessed value of failed Result");
            return std::get<T>(data_);
        }

        T& value() & {
            if (!is_success()) throw std::runtime_error("Accessed value of failed Result");
            return std::get<T>(data_);
        }

        T&& value() && {
            if (!is_success()) throw std::runtime_error("Accessed value of failed Result");
            return std::move(std::get<T>(data_));
        }

        /// @return The contained error, or throws if this is a success.
        [[nodiscard]] const Error& error() const & {
            if (!is_failure()) throw std::runtime_error("Accessed error of successful Result");
            return std::get<Error>(data_);
        }

        Error&& error() && {
            if (!is_failure()) throw std::runtime_error("Accessed error of successful Result");
            return std::move(std::get<Error>(data_));
        }

        T value_or(const T& default_value) const & {
            return is_success() ? std::get<T>(data_) : default_value;
        }

        T value_or(T&& default_value) && {
            return is_success() ? std::move(std::get<T>(data_)) : std::move(default_value);
        }

        /**
         * @brief Applies a function to the value if successful.
         * @return A new Result containing the transformed value or the same error.
         */
        template<typename F>
        auto map(F&& func) && -> Result<decltype(func(std::declval<T>()))> {
            using U = decltype(func(std::declval<T>()));
            if (is_success()) return Result<U>::success(func(std::move(std::get<T>(data_))));
            return Result<U>::failure(std::move(std::get<Error>(data_)));
        }

        /**
         * @brief Chains another fallible operation if successful.
         *
         * The function must return another Result type.
         */
        template<typename F>
        auto and_then(F&& func) && -> decltype(func(std::declval<T>())) {
            if (is_success()) return func(std::move(std::get<T>(data_)));
            using ReturnType = decltype(func(std::declval<T>()));
            return ReturnType::failure(std::move(std::get<Error>(data_)));
        }

        /**
         * @brief Recovers from a failure by invoking `func` with the error.
         *
         * The function must return a Result<T>; successes pass through unchanged.
         */
        template<typename F>
        Result or_else(F&& func) && {
            if (is_failure()) return func(std::move(std::get<Error>(data_)));
            return std::move(*this);
        }

    private:
        std::variant<T, Error> data_;
    };

    /**
     * @brief Specialization for operations that succeed without producing a value.
     */
    template<>
    class Result<void> {
    public:
        Result() : data_(std::monostate{}) {}
        explicit Result(const Error& error) : data_(error) {}
        explicit Result(Error&& error) : data_(std::move(error)) {}

        static Result success() { return {}; }
        static Result failure(const Error& error) { return Result(error); }
        static Result failure(Error&& error) { return Result(std::move(error)); }
        static Result failure(const ErrorCode code, std::string message) {
            return Result(make_error(code, std::move(message)));
        }

        [[nodiscard]] bool is_success() const { return std::holds_alternative<std::monostate>(data_); }
        [[nodiscard]] bool is_failure() const { return std::holds_alternative<Error>(data_); }
        explicit operator bool() const { return is_success(); }

        [[nodiscard]] const Error& error() const & {
            if (!is_failure()) throw std::runtime_error("Accessed error of successful Result");
            return std::get<Error>(data_);
        }

        Error&& error() && {
            if (!is_failure()) throw std::runtime_error("Accessed error of successful Result");
            return std::move(std::get<Error>(data_));
        }

        template<typename F>
        Result and_then(F&& func) && {
            if (is_success()) return func();
            return failure(std::move(std::get<Error>(data_)));
        }

        template<typename F>
        Result or_else(F&& func) && {
            if (is_failure()) return func(std::move(std::get<Error>(data_)));
            return success();
        }

    private:
        std::variant<std::monostate, Error> data_;
    };

    /// Helper for constructing successful results.
    template<typename T>
    Result<std::decay_t<T>> Ok(T&& value) { return Result<std::decay_t<T>>::success(std::forward<T>(value)); }

    inline Result<void> Ok() { return Result<void>::success(); }

    /// Helper for constructing failed results with code + message.
    template<typename T>
    Result<T> Err(ErrorCode code, std::string message) {
        return Result<T>::failure(code, std::move(message));
    }

    inline Result<void> Err(const ErrorCode code, std::string message) {
        return Result<void>::failure(code, std::move(message));
    }

}  // namespace psa::core

#endif //PSA_CORE_RESULT_H
