#include <envdebug/cli/cli.h>

int main(int argc, char** argv)
{
    return envdebug::cli::run(argc, argv);
}
