#include "proofline/cli.hpp"

int main(int argc, char *argv[])
{
    return proofline::cli::run(argc, argv);
}
