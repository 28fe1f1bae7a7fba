#pragma once
#include <PARC/Defines.hpp>
#include <PARC/Exceptions/Exception.hpp>
#include <PARC/Exceptions/ParseException.hpp>
#include <PARC/Parsing/BaseParsers.hpp>
#include <PARC/Parsing/Combinators.hpp>
#include <PARC/Parsing/NumberParsers.hpp>
#include <PARC/Parsing/Parse.hpp>
#include <PARC/Parsing/ParseError.hpp>
#include <PARC/Parsing/ParseState.hpp>
#include <PARC/Parsing/Parser.hpp>
#include <PARC/Parsing/Sequence.hpp>
#include <PARC/Parsing/SourcePosition.hpp>
#include <PARC/Parsing/TextParsers.hpp>
#include <PARC/Parsing/Trace.hpp>
#include <PARC/Primitives.hpp>
