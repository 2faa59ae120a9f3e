//
// Created by aowei on 2026 10月 17.
//

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <boost/program_options.hpp>
#include <munch/log.hpp>
#include <c11/lexer/scanner.hpp>

namespace po = boost::program_options;

std::string read_file_to_string(const std::string &filename) {
    // 以二进制模式打开，避免文本模式下的换行符转换
    std::ifstream file(filename, std::ios::binary);

    // 检查文件是否成功打开
    if (!file.is_open()) {
        throw std::runtime_error("无法打开文件: " + filename + "（可能文件不存在或权限不足）");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // 检查读取过程是否出现错误
    if (file.bad()) {
        throw std::runtime_error("读取文件失败: " + filename);
    }
    return buffer.str();
}

int main(int argc, char **argv) {
    po::options_description visible("Options");
    visible.add_options()
            ("help,h", "produce help message")
            ("dump-dfa,d", po::value<std::string>(), "print the minimized DFA of a scanner context and exit")
            ("log-level,l", po::value<std::string>()->default_value("warn"),
             "trace, debug, info, warn, error, critical or off")
            ("latin1", "decode the input as Latin-1 instead of UTF-8");

    po::options_description hidden("Hidden options");
    hidden.add_options()
            ("input,i", po::value<std::string>(), "input file");

    po::options_description cmdline;
    cmdline.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("input", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(cmdline).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << "munch: " << e.what() << '\n' << visible << '\n';
        return 2;
    }

    if (vm.count("help")) {
        std::cout << "usage: munch <file> [options]\n" << visible << '\n';
        return 0;
    }

    try {
        munch::log::set_level(munch::log::parse_level(vm["log-level"].as<std::string>()));

        const c11::Scanner scanner;

        if (vm.count("dump-dfa")) {
            const auto &name = vm["dump-dfa"].as<std::string>();
            const auto id = scanner.lexer().find(name);
            if (!id) {
                std::cerr << "munch: unknown context '" << name << "'\n";
                return 2;
            }
            scanner.lexer().context(*id).dfa.dump(std::cout, name);
            return 0;
        }

        if (!vm.count("input")) {
            std::cerr << "munch: no input file\n" << visible << '\n';
            return 2;
        }

        const std::string code = read_file_to_string(vm["input"].as<std::string>());
        const auto encoding = vm.count("latin1") ? munch::lexer::Encoding::LATIN1 : munch::lexer::Encoding::UTF8;
        const auto [tokens, errors] = scanner.scan(code, encoding);

        for (const auto &token: tokens) {
            std::cout << token.line << ':' << token.column << '\t'
                    << c11::Scanner::token_type_to_string(token.type) << '\t' << token.value << '\n';
        }
        for (const auto &error: errors) {
            std::cerr << error.line << ':' << error.column << ": "
                    << c11::Scanner::error_type_to_string(error.type) << ": " << error.message << '\n';
        }
        return errors.empty() ? 0 : 1;
    } catch (const std::exception &e) {
        munch::log::logger()->error("{}", e.what());
        return 1;
    }
}
