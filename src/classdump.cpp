#include "classfile.hpp"
#include "dump.hpp"
#include "errors.hpp"


#include <fstream>
#include <stdio.h>
#include <iostream>
#include <sstream>
#include <string>



int main(int argc, char** argv)
{
    if (argc != 2 and argc != 3) {
        puts("usage: classdump <classfile> [output]");
        return 1;
    }

    std::ostringstream rendered;

    try {
        const auto classfile = classdec::parse_classfile(argv[1]);
        classdec::dump(rendered, classfile);
    } catch (const classdec::Error& err) {
        std::cerr << err.what() << std::endl;
        return 2;
    }

    std::cout << rendered.str();

    if (argc == 3) {
        std::ofstream out(argv[2], std::ios::out | std::ios::binary);
        out << rendered.str();

        if (not out) {
            std::cerr << argv[2] << ": failed to write output" << std::endl;
            return 2;
        }
    }

    return 0;
}
