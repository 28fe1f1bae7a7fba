// main.cpp
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "Calculator.hpp"

int main(int argc, char** argv)
{
    bool                     trace = false;
    std::vector<std::string> inputs;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view argument {argv[i]};
        if (argument == "--trace")
            trace = true;
        else
            inputs.emplace_back(argument);
    }

    const Calculator::Evaluator calculator {trace ? PARC::Parsing::MakeStreamTraceSink(std::cerr) : PARC::Parsing::TraceSink {}};

    if (inputs.empty())
    {
        std::string line;
        while (std::getline(std::cin, line))
            inputs.push_back(line);
    }

    int status = 0;
    for (const auto& input : inputs)
    {
        PARC::Parsing::ParseOptions options;
        options.fileName = "<input>";
        try
        {
            std::cout << input << " = " << *calculator.Evaluate(input, options) << "\n";
        }
        catch (const PARC::Exceptions::ParseException& exception)
        {
            std::cerr << exception.what() << "\n";
            status = 1;
        }
    }
    return status;
}
