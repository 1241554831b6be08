#ifndef KVWIRE_ERRORS_H
#define KVWIRE_ERRORS_H

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <variant>

namespace kvwire
{
    enum class KvError : int16_t
    {
        success = 0,
        invalid_frame,
        incomplete_frame,
        unknown_frame_id,
        atoi,
        eof,
        not_enough_data,
        generic_network_error,
        max_recursion_depth,
        frame_too_large,
    };

    std::ostream &operator<<(std::ostream &o, KvError err);

    // eof is the only decode outcome which is not a protocol violation. Everything else ends the connection.
    inline bool is_fatal(const KvError err) noexcept { return err != KvError::success && err != KvError::eof; }

    struct KvErrorCategory final : std::error_category
    {
        [[nodiscard]] const char *name() const noexcept override { return "KvError"; }

        [[nodiscard]] std::string message(int c) const override
        {
            switch (static_cast<KvError>(c))
            {
                case KvError::success:
                    return "success";
                case KvError::invalid_frame:
                    return "invalid frame";
                case KvError::incomplete_frame:
                    return "stream ended in the middle of a frame";
                case KvError::unknown_frame_id:
                    return "unknown frame tag";
                case KvError::atoi:
                    return "cannot convert string to integer";
                case KvError::eof:
                    return "stream reached eof";
                case KvError::not_enough_data:
                    return "eof is seen and the internal buffer does not have enough data to fulfill the request";
                case KvError::generic_network_error:
                    return "network error occurred";
                case KvError::max_recursion_depth:
                    return "reached frame nesting limit";
                case KvError::frame_too_large:
                    return "declared length exceeds the configured limit";
            }
            return "kvwire::KvError::unknown";
        }
    };

    inline const KvErrorCategory &kv_error_category() noexcept
    {
        static KvErrorCategory instance;
        return instance;
    }

    inline std::error_code make_error_code(KvError e) noexcept { return {static_cast<int>(e), kv_error_category()}; }

    template<typename T>
    struct Result
    {
        std::variant<T, KvError> data;

        [[nodiscard]] constexpr bool is_error() const noexcept { return std::holds_alternative<KvError>(data); }

        [[nodiscard]] constexpr const T &value() const
        {
            if (is_error())
            {
                throw std::logic_error("cannot get value from an error variant");
            }
            return std::get<T>(data);
        }

        [[nodiscard]] constexpr T &value()
        {
            if (is_error())
            {
                throw std::logic_error("cannot get value from an error variant");
            }
            return std::get<T>(data);
        }

        [[nodiscard]] constexpr KvError error() const
        {
            if (!is_error())
            {
                throw std::logic_error("result does not contain an error");
            }
            return std::get<KvError>(data);
        }
    };

    /**
     * @brief CommandError reports a recoverable failure of a single request: unknown command, wrong arity or a bad
     * argument. It never ends a connection, the dispatcher turns it into an error frame.
     */
    class CommandError : public std::runtime_error
    {
    public:
        explicit CommandError(const std::string &message) : std::runtime_error(message) {}
    };

}  // namespace kvwire

namespace std
{
    template<>
    struct is_error_code_enum<kvwire::KvError> : true_type
    {
    };
}  // namespace std

#endif  // KVWIRE_ERRORS_H
