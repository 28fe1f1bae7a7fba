#include <PARC/Parsing/NumberParsers.hpp>

#include <PARC/Parsing/Combinators.hpp>
#include <PARC/Parsing/Sequence.hpp>
#include <PARC/Parsing/TextParsers.hpp>

#include "DigitValue.hpp"

#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace PARC::Parsing
{
    namespace
    {
        constexpr UInt64 kMaxMagnitude = static_cast<UInt64>(std::numeric_limits<Int64>::max());

        /// @brief One or more digits of `base` read as an unsigned value.
        Parser<UInt64> Magnitude(UInt32 base)
        {
            detail::ValidateBase(base);
            return Sequence([base, digits = OneOrMore(DigitCharacter(base))](SequenceScope& s) {
                auto units = s(digits);
                if (!units)
                    return s.Abort<UInt64>();

                UInt64      number = 0;
                const char* first  = units->data();
                const char* last   = first + units->size();
                const auto [ptr, ec] = std::from_chars(first, last, number, static_cast<int>(base));
                if (ec == std::errc::result_out_of_range)
                    return Fail<UInt64>("number out of range");
                if (ec != std::errc {} || ptr != last)
                    return Fail<UInt64>("invalid number");
                return Value(number);
            });
        }
    }// namespace

    Parser<Int32> Digit(UInt32 base)
    {
        detail::ValidateBase(base);
        return Sequence([base, token = Token()](SequenceScope& s) {
            auto unit = s(token);
            if (!unit)
                return s.Abort<Int32>();

            const UInt32 digit = detail::DigitValue(*unit);
            if (digit >= base)
                return Fail<Int32>("invalid digit");
            return Value(static_cast<Int32>(digit));
        });
    }

    Parser<Int64> NaturalNumber(UInt32 base)
    {
        return Bind(Magnitude(base), [](const UInt64& magnitude) {
            if (magnitude > kMaxMagnitude)
                return Fail<Int64>("number out of range");
            return Value(static_cast<Int64>(magnitude));
        });
    }

    Parser<Int64> Integer(UInt32 base)
    {
        auto sign      = Maybe(Or(Character('+'), Character('-')));
        auto magnitude = Magnitude(base);
        return Sequence([sign = std::move(sign), magnitude = std::move(magnitude)](SequenceScope& s) {
            auto prefix = s(sign);
            if (!prefix)
                return s.Abort<Int64>();
            auto number = s(magnitude);
            if (!number)
                return s.Abort<Int64>();

            const bool negative = prefix->has_value() && **prefix == '-';
            if (!negative)
            {
                if (*number > kMaxMagnitude)
                    return Fail<Int64>("number out of range");
                return Value(static_cast<Int64>(*number));
            }

            // The magnitude of the lowest Int64 is one past the highest.
            if (*number > kMaxMagnitude + 1)
                return Fail<Int64>("number out of range");
            if (*number == kMaxMagnitude + 1)
                return Value(std::numeric_limits<Int64>::min());
            return Value(-static_cast<Int64>(*number));
        });
    }
}// namespace PARC::Parsing
