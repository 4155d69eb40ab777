// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#pragma once

#include <errorhandling.hpp>
#include <pdfobjects.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chromapdf::internal {

enum class PsOp : uint8_t {
    Abs,
    Add,
    And,
    Atan,
    Bitshift,
    Ceiling,
    Copy,
    Cos,
    Cvi,
    Cvr,
    Div,
    Dup,
    Eq,
    Exch,
    Exp,
    False,
    Floor,
    Ge,
    Gt,
    Idiv,
    Index,
    Le,
    Ln,
    Log,
    Lt,
    Mod,
    Mul,
    Ne,
    Neg,
    Not,
    Or,
    Pop,
    Roll,
    Round,
    Sin,
    Sqrt,
    Sub,
    True,
    Truncate,
    Xor,
    // Not named operators, generated by the compiler.
    Push,
    Jump,
    JumpIfZero,
};

struct PsCode {
    PsOp op;
    double d = 0;
    int32_t target = 0;
};

// A type 4 function body compiled into a flat instruction list.
// The conditional blocks of if and ifelse become jumps.
class PostScriptCalculator {
public:
    static rvoe<PostScriptCalculator> compile(std::string_view code);

    // Returns the whole operand stack, bottom first.
    rvoe<std::vector<double>> execute(const std::vector<double> &inputs) const;

    size_t size() const { return program.size(); }

private:
    rvoe<NoReturnValue> compile_block(const std::vector<std::string> &tokens, size_t &pos);

    std::vector<PsCode> program;
};

struct PdfFunction;

struct FunctionType2 {
    std::vector<double> domain;
    std::vector<double> C0;
    std::vector<double> C1;
    double n;
};

// Multiple subfunctions over consecutive subdomains.
struct FunctionType3 {
    std::vector<double> domain;
    std::vector<PdfFunction> functions;
    std::vector<double> bounds;
    std::vector<double> encode;
};

struct FunctionType4 {
    std::vector<double> domain;
    std::vector<double> range;
    std::string code;
    std::shared_ptr<const PostScriptCalculator> compiled;
};

struct PdfFunction {
    std::variant<FunctionType2, FunctionType3, FunctionType4> f;
};

rvoe<std::vector<double>> evaluate_function(const PdfFunction &func,
                                            const std::vector<double> &inputs);

// The stream contents are only needed for type 4 functions.
rvoe<PdfFunction> function_from_dict(const PdfDict &dict, std::string_view stream_data = {});

// Either a function dictionary or a function stream.
rvoe<PdfFunction> function_from_value(const PdfValue &val);

rvoe<FunctionType4> make_type4_function(std::vector<double> domain,
                                        std::vector<double> range,
                                        std::string code);

} // namespace chromapdf::internal
