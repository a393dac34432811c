#include "cli/application.hpp"

int main(int argc, char** argv)
{
    return huffpack::cli::run(argc, argv);
}
