#include "judge/inspection.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <cctype>
#include <vector>

namespace runner {
using namespace std;

static bool is_word_char(char ch) {
    return isalnum((unsigned char)ch) || ch == '_';
}

static bool is_space(char ch) {
    return isspace((unsigned char)ch);
}

/**
 * @brief 逐个扫描 variable 在源代码中出现的位置，匹配 "variable 空白 = 空白"
 * 只做一遍线性扫描，不会因为很长的一行代码而耗尽栈空间
 */
struct assignment_scanner {
    assignment_scanner(const string &source, const string &variable)
        : source(source), variable(variable), pos(string::npos), run_begin(string::npos), run_end(0) {}

    /**
     * @brief 移动到下一个赋值号，返回赋值号之后的位置，没有更多赋值时返回 string::npos
     */
    size_t next() {
        if (variable.empty()) return string::npos;
        while (true) {
            pos = source.find(variable, pos == string::npos ? 0 : pos + 1);
            if (pos == string::npos) return string::npos;
            size_t i = skip_spaces(pos + variable.size());
            if (i < source.size() && source[i] == '=') return i + 1;
        }
    }

    /**
     * @brief 变量名前是否是单词边界
     */
    bool at_word_boundary() const {
        bool before = pos > 0 && is_word_char(source[pos - 1]);
        return before != is_word_char(variable.front());
    }

    /**
     * @brief 跳过 i 开始的空白字符
     * 同一段空白只扫描一次，变量名本身以空白结尾时也不会退化成平方复杂度
     */
    size_t skip_spaces(size_t i) {
        if (run_begin != string::npos && i >= run_begin && i <= run_end) return run_end;
        run_begin = i;
        while (i < source.size() && is_space(source[i])) ++i;
        run_end = i;
        return i;
    }

    const string &source;
    const string &variable;
    size_t pos;
    size_t run_begin, run_end;
};

bool has_assignment(const string &source, const string &variable) {
    assignment_scanner scanner(source, variable);
    while (scanner.next() != string::npos)
        if (scanner.at_word_boundary()) return true;
    return false;
}

optional<string> find_first_assignment(const string &source, const string &variable) {
    assignment_scanner scanner(source, variable);
    for (size_t eq = scanner.next(); eq != string::npos; eq = scanner.next()) {
        size_t begin = scanner.skip_spaces(eq);
        if (begin < source.size()) {
            size_t end = source.find('\n', begin);
            return boost::algorithm::trim_copy(source.substr(begin, end == string::npos ? string::npos : end - begin));
        }
        // 赋值号之后直到文件末尾都是空白，只要其中有一个不是换行符，取值就是空串
        if (source.find_first_not_of('\n', eq) != string::npos) return string();
    }
    return nullopt;
}

static bool quoted_by(const string &literal, char quote) {
    return !literal.empty() && literal.front() == quote && literal.back() == quote;
}

static bool enclosed_by(const string &literal, char open, char close) {
    return !literal.empty() && literal.front() == open && literal.back() == close;
}

static bool all_digits(const string &text, size_t begin, size_t end) {
    return begin < end && all_of(text.begin() + begin, text.begin() + end, [](char ch) {
               return isdigit((unsigned char)ch);
           });
}

string infer_literal_type(const string &literal) {
    size_t dot = literal.find('.');

    if (quoted_by(literal, '"') || quoted_by(literal, '\''))
        return "string";
    else if (all_digits(literal, 0, literal.size()))
        return "integer";
    else if (dot != string::npos && all_digits(literal, 0, dot) && all_digits(literal, dot + 1, literal.size()))
        return "float";
    else if (enclosed_by(literal, '[', ']'))
        return "list";
    else if (enclosed_by(literal, '{', '}'))
        return "dict";
    else
        return "unknown";
}

bool type_name_matches(const string &inferred, const string &expected) {
    if (inferred == expected) return true;
    if (inferred == "string") return expected == "str";
    if (inferred == "integer") return expected == "int";
    return false;
}

optional<string> find_list_literal(const string &source, const string &variable) {
    assignment_scanner scanner(source, variable);
    for (size_t eq = scanner.next(); eq != string::npos; eq = scanner.next()) {
        size_t open = scanner.skip_spaces(eq);
        if (open >= source.size() || source[open] != '[') continue;
        // 方括号内至少一个字符，并且不能跨行
        size_t line_end = source.find('\n', open + 1);
        if (line_end == string::npos) line_end = source.size();
        if (open + 2 > line_end) continue;
        size_t close = source.find(']', open + 2);
        if (close == string::npos || close >= line_end) continue;
        return source.substr(open + 1, close - open - 1);
    }
    return nullopt;
}

size_t count_list_items(const string &contents) {
    vector<string> items;
    boost::split(items, contents, boost::is_any_of(","));
    size_t count = 0;
    for (auto &item : items)
        if (!boost::algorithm::trim_copy(item).empty())
            ++count;
    return count;
}

static string python_quote(const string &text) {
    // 与 Python 相同：含单引号且不含双引号时使用双引号
    char quote = text.find('\'') != string::npos && text.find('"') == string::npos ? '"' : '\'';
    string result(1, quote);
    for (char ch : text) {
        if (ch == '\\' || ch == quote) result += '\\';
        if (ch == '\n')
            result += "\\n";
        else if (ch == '\t')
            result += "\\t";
        else
            result += ch;
    }
    result += quote;
    return result;
}

static string python_repr(const nlohmann::json &value) {
    if (value.is_string()) return python_quote(value.get<string>());
    if (value.is_boolean()) return value.get<bool>() ? "True" : "False";
    if (value.is_null()) return "None";
    if (value.is_array()) {
        vector<string> items;
        for (auto &item : value) items.push_back(python_repr(item));
        return "[" + boost::algorithm::join(items, ", ") + "]";
    }
    if (value.is_object()) {
        vector<string> items;
        for (const auto &el : value.items()) items.push_back(python_quote(el.key()) + ": " + python_repr(el.value()));
        return "{" + boost::algorithm::join(items, ", ") + "}";
    }
    return value.dump();
}

string python_str(const nlohmann::json &value) {
    if (value.is_string()) return value.get<string>();
    return python_repr(value);
}

string json_token(const nlohmann::json &value) {
    if (value.is_array()) {
        vector<string> items;
        for (auto &item : value) items.push_back(json_token(item));
        return "[" + boost::algorithm::join(items, ", ") + "]";
    }
    if (value.is_object()) {
        vector<string> items;
        for (const auto &el : value.items())
            items.push_back(nlohmann::json(el.key()).dump(-1, ' ', true) + ": " + json_token(el.value()));
        return "{" + boost::algorithm::join(items, ", ") + "}";
    }
    return value.dump(-1, ' ', true);
}

}  // namespace runner
