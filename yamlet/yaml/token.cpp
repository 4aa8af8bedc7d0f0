/*
 * token.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-02

Description: Token model shared by the YAML reader and writer

**************************************************/

#include "token.hpp"

namespace yamlet {

auto toString(TokenType type) -> const char* {
    switch (type) {
        case TokenType::None:
            return "None";
        case TokenType::StreamStart:
            return "StreamStart";
        case TokenType::StreamEnd:
            return "StreamEnd";
        case TokenType::DocumentStart:
            return "DocumentStart";
        case TokenType::DocumentEnd:
            return "DocumentEnd";
        case TokenType::MappingStart:
            return "MappingStart";
        case TokenType::MappingEnd:
            return "MappingEnd";
        case TokenType::SequenceStart:
            return "SequenceStart";
        case TokenType::SequenceEnd:
            return "SequenceEnd";
        case TokenType::Scalar:
            return "Scalar";
        case TokenType::Alias:
            return "Alias";
        case TokenType::Comment:
            return "Comment";
    }
    return "Unknown";
}

auto toString(ScalarTag tag) -> const char* {
    switch (tag) {
        case ScalarTag::Null:
            return "null";
        case ScalarTag::Bool:
            return "bool";
        case ScalarTag::Int:
            return "int";
        case ScalarTag::Float:
            return "float";
        case ScalarTag::String:
            return "str";
    }
    return "unknown";
}

}  // namespace yamlet
