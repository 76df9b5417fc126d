#include <algorithm>
#include <string>
#include <cctype>

static inline bool is_key(const char *arg)
{
    if (*arg != '-') return false;
    ++arg; // eat 1st dash
    if (*arg == '\0') return false;
    if (isdigit(*arg)) return false;
    if (isalpha(*arg)) return true;
    ++arg; // eat 2nd dash
    return isalnum(*arg);
}

static inline bool has_key(const char **begin, const char **end, const char *key)
{
    return std::find(begin, end, std::string { key }) != end;
}

static inline bool has_value(const char **begin, const char **end, const char *key)
{
    const char **iter = std::find(begin, end, std::string { key });
    return iter != end && ++iter != end && !is_key(*iter);
}

static inline const char *get_value(const char **begin, const char **end, const char *key)
{
    if (!has_value(begin, end, key)) return nullptr;
    return *(std::find(begin, end, std::string { key }) + 1);
}
