#include "utilities.hpp"

#include <fstream>

std::string util::trim(const std::string_view& str)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    auto begin = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    if (begin >= end)
        return std::string{};

    return std::string{begin, end};
}

std::string util::read_file(const std::string_view& filename)
{
    constexpr auto read_size = std::size_t(4096);
    auto stream = std::ifstream(std::string{filename});
    if (!stream)
        throw std::ios_base::failure("unable to open " + std::string{filename});
    stream.exceptions(std::ios_base::badbit);

    auto out = std::string();
    auto buf = std::string(read_size, '\0');
    while (stream.read(&buf[0], read_size))
        out.append(buf, 0, static_cast<unsigned long>(stream.gcount()));
    out.append(buf, 0, static_cast<unsigned long>(stream.gcount()));
    return out;
}

std::vector<std::string_view> util::split_string(const std::string_view& s, char delimiter)
{
    std::vector<std::string_view> tokens;
    size_t last = 0;
    size_t next;
    while ((next = s.find(delimiter, last)) != std::string_view::npos)
    {
        tokens.push_back(s.substr(last, next - last));
        last = next + 1;
    }
    tokens.push_back(s.substr(last));
    return tokens;
}
