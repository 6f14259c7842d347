//local
#include <cli/cli.hpp>

int main(int argc, char* argv[])
{
    // Validate, compact or format the given number and print the result as json
    // Exit status reports whether the number is well-formed
    return taxid::cli::run(argc, argv);
}
