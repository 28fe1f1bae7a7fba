#include <PARC/Parsing/Parse.hpp>

#include <memory>

namespace PARC::Parsing
{
    ParseState MakeInitialState(std::string_view input, const ParseOptions& options)
    {
        ParseState state;
        state.remaining = input;
        state.position  = SourcePosition {options.fileName};
        if (options.userState.has_value())
            state.userState = std::make_shared<std::any>(options.userState);
        return state;
    }
}// namespace PARC::Parsing
