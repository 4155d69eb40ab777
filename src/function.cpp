// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 The ChromaPDF authors

#include <function.hpp>
#include <utils.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <numbers>

namespace chromapdf::internal {

namespace {

const size_t ps_stack_size = 100;

// Alphabetical, the index is the PsOp value.
const std::array<const char *, 40> ps_op_names{
    "abs",   "add",   "and", "atan", "bitshift", "ceiling", "copy",     "cos",
    "cvi",   "cvr",   "div", "dup",  "eq",       "exch",    "exp",      "false",
    "floor", "ge",    "gt",  "idiv", "index",    "le",      "ln",       "log",
    "lt",    "mod",   "mul", "ne",   "neg",      "not",     "or",       "pop",
    "roll",  "round", "sin", "sqrt", "sub",      "true",    "truncate", "xor"};

std::vector<std::string> tokenize_program(std::string_view code) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while(i < code.size()) {
        const char c = code[i];
        if(isspace((unsigned char)c)) {
            ++i;
        } else if(c == '%') {
            while(i < code.size() && code[i] != '\n' && code[i] != '\r') {
                ++i;
            }
        } else if(c == '{' || c == '}') {
            tokens.emplace_back(1, c);
            ++i;
        } else {
            const size_t start = i;
            while(i < code.size() && !isspace((unsigned char)code[i]) && code[i] != '{' &&
                  code[i] != '}' && code[i] != '%') {
                ++i;
            }
            tokens.emplace_back(code.substr(start, i - start));
        }
    }
    return tokens;
}

// Integer operators need operands that fit in an int64_t.
rvoe<int64_t> to_integer(double d) {
    if(!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) {
        fprintf(stderr, "PostScript integer operand %g out of range.\n", d);
        RETERR(FunctionStackError);
    }
    return (int64_t)d;
}

int64_t bitshift(int64_t value, int64_t shift) {
    if(shift >= 64) {
        return 0;
    }
    if(shift <= -64) {
        return value < 0 ? -1 : 0;
    }
    if(shift >= 0) {
        return (int64_t)((uint64_t)value << shift);
    }
    return value >> -shift;
}

double clamp_to(double x, const std::vector<double> &limits, size_t i) {
    if(limits.size() < 2 * i + 2) {
        return x;
    }
    return std::clamp(x, limits[2 * i], limits[2 * i + 1]);
}

double interpolate(double x, double xmin, double xmax, double ymin, double ymax) {
    if(xmax == xmin) {
        return ymin;
    }
    return ymin + (x - xmin) * (ymax - ymin) / (xmax - xmin);
}

rvoe<std::vector<double>> evaluate_type2(const FunctionType2 &f, const std::vector<double> &in) {
    if(in.empty()) {
        RETERR(WrongOperandCount);
    }
    const double x = clamp_to(in[0], f.domain, 0);
    const std::vector<double> c0 = f.C0.empty() ? std::vector<double>{0.0} : f.C0;
    const std::vector<double> c1 = f.C1.empty() ? std::vector<double>{1.0} : f.C1;
    if(c0.size() != c1.size()) {
        RETERR(UnsupportedFunction);
    }
    std::vector<double> out;
    out.reserve(c0.size());
    const double xn = std::pow(x, f.n);
    for(size_t i = 0; i < c0.size(); ++i) {
        out.push_back(c0[i] + xn * (c1[i] - c0[i]));
    }
    return out;
}

rvoe<std::vector<double>> evaluate_type3(const FunctionType3 &f, const std::vector<double> &in) {
    if(in.empty() || f.functions.empty() || f.domain.size() < 2) {
        RETERR(UnsupportedFunction);
    }
    const double x = clamp_to(in[0], f.domain, 0);
    size_t i = 0;
    while(i < f.bounds.size() && x >= f.bounds[i]) {
        ++i;
    }
    if(i >= f.functions.size() || f.encode.size() < 2 * f.functions.size()) {
        RETERR(UnsupportedFunction);
    }
    const double low = i == 0 ? f.domain[0] : f.bounds[i - 1];
    const double high = i == f.bounds.size() ? f.domain[1] : f.bounds[i];
    const double encoded = interpolate(x, low, high, f.encode[2 * i], f.encode[2 * i + 1]);
    return evaluate_function(f.functions[i], std::vector<double>{encoded});
}

rvoe<std::vector<double>> evaluate_type4(const FunctionType4 &f, const std::vector<double> &in) {
    std::shared_ptr<const PostScriptCalculator> calc = f.compiled;
    if(!calc) {
        ERC(compiled, PostScriptCalculator::compile(f.code));
        calc = std::make_shared<PostScriptCalculator>(std::move(compiled));
    }
    const size_t num_in = f.domain.size() / 2;
    const size_t num_out = f.range.size() / 2;
    if(in.size() < num_in) {
        RETERR(WrongOperandCount);
    }
    std::vector<double> clamped;
    for(size_t i = 0; i < num_in; ++i) {
        clamped.push_back(clamp_to(in[i], f.domain, i));
    }
    ERC(stack, calc->execute(clamped));
    if(stack.size() < num_out) {
        fprintf(stderr, "PostScript function left too few values on the stack.\n");
        RETERR(FunctionStackError);
    }
    std::vector<double> out(stack.end() - num_out, stack.end());
    for(size_t i = 0; i < num_out; ++i) {
        out[i] = clamp_to(out[i], f.range, i);
    }
    return out;
}

} // namespace

rvoe<PostScriptCalculator> PostScriptCalculator::compile(std::string_view code) {
    auto tokens = tokenize_program(code);
    if(tokens.empty() || tokens.front() != "{") {
        fprintf(stderr, "PostScript function does not start with '{'.\n");
        RETERR(UnsupportedFunction);
    }
    PostScriptCalculator calc;
    size_t pos = 1;
    ERCV(calc.compile_block(tokens, pos));
    if(pos != tokens.size()) {
        fprintf(stderr, "Trailing data after PostScript function.\n");
        RETERR(UnsupportedFunction);
    }
    return calc;
}

rvoe<NoReturnValue> PostScriptCalculator::compile_block(const std::vector<std::string> &tokens,
                                                        size_t &pos) {
    while(true) {
        if(pos >= tokens.size()) {
            fprintf(stderr, "Unexpected end of PostScript function.\n");
            RETERR(UnsupportedFunction);
        }
        const std::string &tok = tokens[pos++];
        const char first = tok.front();
        if(isdigit((unsigned char)first) || first == '.' || first == '-' || first == '+') {
            char *end = nullptr;
            const double value = strtod(tok.c_str(), &end);
            if(end == tok.c_str() || *end != '\0') {
                fprintf(stderr, "Malformed number '%s' in PostScript function.\n", tok.c_str());
                RETERR(UnsupportedFunction);
            }
            program.push_back(PsCode{PsOp::Push, value, 0});
        } else if(tok == "{") {
            const size_t cond_jump = program.size();
            program.push_back(PsCode{PsOp::JumpIfZero, 0, 0});
            ERCV(compile_block(tokens, pos));
            if(pos >= tokens.size()) {
                fprintf(stderr, "Unexpected end of PostScript function.\n");
                RETERR(UnsupportedFunction);
            }
            const std::string &next = tokens[pos++];
            if(next == "if") {
                program[cond_jump].target = (int32_t)program.size();
            } else if(next == "{") {
                const size_t skip_jump = program.size();
                program.push_back(PsCode{PsOp::Jump, 0, 0});
                program[cond_jump].target = (int32_t)program.size();
                ERCV(compile_block(tokens, pos));
                if(pos >= tokens.size() || tokens[pos++] != "ifelse") {
                    fprintf(stderr, "Expected 'ifelse' in PostScript function.\n");
                    RETERR(UnsupportedFunction);
                }
                program[skip_jump].target = (int32_t)program.size();
            } else {
                fprintf(stderr, "Expected 'if' in PostScript function.\n");
                RETERR(UnsupportedFunction);
            }
        } else if(tok == "}") {
            RETOK;
        } else {
            auto it = std::find_if(ps_op_names.begin(), ps_op_names.end(), [&tok](const char *n) {
                return tok == n;
            });
            if(it == ps_op_names.end()) {
                fprintf(stderr, "Unknown operator '%s' in PostScript function.\n", tok.c_str());
                RETERR(UnsupportedFunction);
            }
            program.push_back(PsCode{(PsOp)(it - ps_op_names.begin()), 0, 0});
        }
    }
}

rvoe<std::vector<double>> PostScriptCalculator::execute(const std::vector<double> &inputs) const {
    std::vector<double> stack(inputs);
    auto need = [&stack](size_t n) { return stack.size() >= n; };
    auto pop = [&stack]() {
        const double v = stack.back();
        stack.pop_back();
        return v;
    };
    size_t ip = 0;
    while(ip < program.size()) {
        const PsCode &c = program[ip++];
        switch(c.op) {
        case PsOp::Push:
            stack.push_back(c.d);
            break;
        case PsOp::Jump:
            ip = c.target;
            break;
        case PsOp::JumpIfZero:
            if(!need(1)) {
                RETERR(FunctionStackError);
            }
            if(pop() == 0) {
                ip = c.target;
            }
            break;
        case PsOp::True:
            stack.push_back(1);
            break;
        case PsOp::False:
            stack.push_back(0);
            break;
        case PsOp::Abs:
        case PsOp::Ceiling:
        case PsOp::Cos:
        case PsOp::Cvi:
        case PsOp::Cvr:
        case PsOp::Floor:
        case PsOp::Ln:
        case PsOp::Log:
        case PsOp::Neg:
        case PsOp::Not:
        case PsOp::Round:
        case PsOp::Sin:
        case PsOp::Sqrt:
        case PsOp::Truncate: {
            if(!need(1)) {
                RETERR(FunctionStackError);
            }
            double &t = stack.back();
            switch(c.op) {
            case PsOp::Abs:
                t = std::fabs(t);
                break;
            case PsOp::Ceiling:
                t = std::ceil(t);
                break;
            case PsOp::Cos:
                t = std::cos(t * std::numbers::pi / 180.0);
                break;
            case PsOp::Cvi:
            case PsOp::Truncate:
                t = std::trunc(t);
                break;
            case PsOp::Cvr:
                break;
            case PsOp::Floor:
                t = std::floor(t);
                break;
            case PsOp::Ln:
                t = std::log(t);
                break;
            case PsOp::Log:
                t = std::log10(t);
                break;
            case PsOp::Neg:
                t = -t;
                break;
            case PsOp::Not:
                t = t == 0 ? 1 : 0;
                break;
            case PsOp::Round:
                t = t >= 0 ? std::floor(t + 0.5) : std::ceil(t - 0.5);
                break;
            case PsOp::Sin:
                t = std::sin(t * std::numbers::pi / 180.0);
                break;
            case PsOp::Sqrt:
                t = std::sqrt(t);
                break;
            default:
                RETERR(Unreachable);
            }
            break;
        }
        case PsOp::Add:
        case PsOp::And:
        case PsOp::Atan:
        case PsOp::Bitshift:
        case PsOp::Div:
        case PsOp::Eq:
        case PsOp::Exp:
        case PsOp::Ge:
        case PsOp::Gt:
        case PsOp::Idiv:
        case PsOp::Le:
        case PsOp::Lt:
        case PsOp::Mod:
        case PsOp::Mul:
        case PsOp::Ne:
        case PsOp::Or:
        case PsOp::Sub:
        case PsOp::Xor: {
            if(!need(2)) {
                RETERR(FunctionStackError);
            }
            const double b = pop();
            double &a = stack.back();
            switch(c.op) {
            case PsOp::Add:
                a = a + b;
                break;
            case PsOp::And: {
                ERC(ia, to_integer(a));
                ERC(ib, to_integer(b));
                a = (double)(ia & ib);
                break;
            }
            case PsOp::Atan: {
                double angle = std::atan2(a, b) * 180.0 / std::numbers::pi;
                if(angle < 0) {
                    angle += 360.0;
                }
                a = angle;
                break;
            }
            case PsOp::Bitshift: {
                ERC(value, to_integer(a));
                ERC(shift, to_integer(b));
                a = (double)bitshift(value, shift);
                break;
            }
            case PsOp::Div:
                a = a / b;
                break;
            case PsOp::Eq:
                a = a == b ? 1 : 0;
                break;
            case PsOp::Exp:
                a = std::pow(a, b);
                break;
            case PsOp::Ge:
                a = a >= b ? 1 : 0;
                break;
            case PsOp::Gt:
                a = a > b ? 1 : 0;
                break;
            case PsOp::Idiv: {
                ERC(ia, to_integer(a));
                ERC(ib, to_integer(b));
                if(ib == 0) {
                    RETERR(FunctionStackError);
                }
                // INT64_MIN / -1 does not fit.
                a = ib == -1 ? -(double)ia : (double)(ia / ib);
                break;
            }
            case PsOp::Le:
                a = a <= b ? 1 : 0;
                break;
            case PsOp::Lt:
                a = a < b ? 1 : 0;
                break;
            case PsOp::Mod: {
                ERC(ia, to_integer(a));
                ERC(ib, to_integer(b));
                if(ib == 0) {
                    RETERR(FunctionStackError);
                }
                a = ib == -1 ? 0.0 : (double)(ia % ib);
                break;
            }
            case PsOp::Mul:
                a = a * b;
                break;
            case PsOp::Ne:
                a = a != b ? 1 : 0;
                break;
            case PsOp::Or: {
                ERC(ia, to_integer(a));
                ERC(ib, to_integer(b));
                a = (double)(ia | ib);
                break;
            }
            case PsOp::Sub:
                a = a - b;
                break;
            case PsOp::Xor: {
                ERC(ia, to_integer(a));
                ERC(ib, to_integer(b));
                a = (double)(ia ^ ib);
                break;
            }
            default:
                RETERR(Unreachable);
            }
            break;
        }
        case PsOp::Dup:
            if(!need(1)) {
                RETERR(FunctionStackError);
            }
            stack.push_back(stack.back());
            break;
        case PsOp::Exch:
            if(!need(2)) {
                RETERR(FunctionStackError);
            }
            std::swap(stack[stack.size() - 1], stack[stack.size() - 2]);
            break;
        case PsOp::Pop:
            if(!need(1)) {
                RETERR(FunctionStackError);
            }
            stack.pop_back();
            break;
        case PsOp::Copy: {
            if(!need(1)) {
                RETERR(FunctionStackError);
            }
            ERC(n, to_integer(pop()));
            if(n < 0 || !need((size_t)n)) {
                RETERR(FunctionStackError);
            }
            const size_t start = stack.size() - n;
            for(int64_t i = 0; i < n; ++i) {
                stack.push_back(stack[start + i]);
            }
            break;
        }
        case PsOp::Index: {
            if(!need(1)) {
                RETERR(FunctionStackError);
            }
            ERC(k, to_integer(pop()));
            if(k < 0 || !need((size_t)k + 1)) {
                RETERR(FunctionStackError);
            }
            stack.push_back(stack[stack.size() - 1 - k]);
            break;
        }
        case PsOp::Roll: {
            if(!need(2)) {
                RETERR(FunctionStackError);
            }
            ERC(j, to_integer(pop()));
            ERC(n, to_integer(pop()));
            if(n < 0 || !need((size_t)n)) {
                RETERR(FunctionStackError);
            }
            if(n == 0) {
                break;
            }
            j %= n;
            if(j < 0) {
                j += n;
            }
            auto first = stack.end() - n;
            std::rotate(first, stack.end() - j, stack.end());
            break;
        }
        }
        if(stack.size() > ps_stack_size) {
            RETERR(FunctionStackError);
        }
    }
    return stack;
}

rvoe<std::vector<double>> evaluate_function(const PdfFunction &func,
                                            const std::vector<double> &inputs) {
    return std::visit(
        overloaded{
            [&inputs](const FunctionType2 &f) { return evaluate_type2(f, inputs); },
            [&inputs](const FunctionType3 &f) { return evaluate_type3(f, inputs); },
            [&inputs](const FunctionType4 &f) { return evaluate_type4(f, inputs); },
        },
        func.f);
}

rvoe<FunctionType4>
make_type4_function(std::vector<double> domain, std::vector<double> range, std::string code) {
    ERC(calc, PostScriptCalculator::compile(code));
    FunctionType4 f;
    f.domain = std::move(domain);
    f.range = std::move(range);
    f.code = std::move(code);
    f.compiled = std::make_shared<PostScriptCalculator>(std::move(calc));
    return f;
}

rvoe<PdfFunction> function_from_value(const PdfValue &val) {
    if(auto *stream = as_stream(val)) {
        return function_from_dict(stream->dict, stream->data);
    }
    if(auto *dict = as_dict(val)) {
        return function_from_dict(*dict);
    }
    fprintf(stderr, "Function must be a dictionary or a stream.\n");
    RETERR(UnsupportedFunction);
}

rvoe<PdfFunction> function_from_dict(const PdfDict &dict, std::string_view stream_data) {
    auto *type_obj = dict_get(dict, "FunctionType");
    if(!type_obj || !as_number(*type_obj)) {
        RETERR(UnsupportedFunction);
    }
    const int type = (int)*as_number(*type_obj);
    std::vector<double> domain;
    if(auto *d = dict_get(dict, "Domain")) {
        auto arr = as_number_array(*d);
        if(!arr) {
            RETERR(WrongOperandType);
        }
        domain = std::move(*arr);
    }
    switch(type) {
    case 2: {
        FunctionType2 f;
        f.domain = std::move(domain);
        f.n = 1.0;
        if(auto *n = dict_get(dict, "N"); n && as_number(*n)) {
            f.n = *as_number(*n);
        }
        if(auto *c0 = dict_get(dict, "C0")) {
            auto arr = as_number_array(*c0);
            if(!arr) {
                RETERR(WrongOperandType);
            }
            f.C0 = std::move(*arr);
        }
        if(auto *c1 = dict_get(dict, "C1")) {
            auto arr = as_number_array(*c1);
            if(!arr) {
                RETERR(WrongOperandType);
            }
            f.C1 = std::move(*arr);
        }
        return PdfFunction{std::move(f)};
    }
    case 3: {
        FunctionType3 f;
        f.domain = std::move(domain);
        auto *funcs = dict_get(dict, "Functions");
        if(!funcs || !as_array(*funcs)) {
            RETERR(UnsupportedFunction);
        }
        for(const auto &sub : *as_array(*funcs)) {
            ERC(subfunc, function_from_value(sub));
            f.functions.emplace_back(std::move(subfunc));
        }
        if(auto *b = dict_get(dict, "Bounds")) {
            auto arr = as_number_array(*b);
            if(!arr) {
                RETERR(WrongOperandType);
            }
            f.bounds = std::move(*arr);
        }
        if(auto *e = dict_get(dict, "Encode")) {
            auto arr = as_number_array(*e);
            if(!arr) {
                RETERR(WrongOperandType);
            }
            f.encode = std::move(*arr);
        }
        return PdfFunction{std::move(f)};
    }
    case 4: {
        std::vector<double> range;
        if(auto *r = dict_get(dict, "Range")) {
            auto arr = as_number_array(*r);
            if(!arr) {
                RETERR(WrongOperandType);
            }
            range = std::move(*arr);
        }
        if(range.empty()) {
            fprintf(stderr, "Type 4 function is missing range.\n");
            RETERR(UnsupportedFunction);
        }
        ERC(f, make_type4_function(std::move(domain), std::move(range), std::string(stream_data)));
        return PdfFunction{std::move(f)};
    }
    default:
        fprintf(stderr, "Function type %d is not supported.\n", type);
        RETERR(UnsupportedFunction);
    }
}

} // namespace chromapdf::internal
