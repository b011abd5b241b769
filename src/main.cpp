#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"

int main(int argc, char** argv)
{
    ConfigGlobal::InitializeDefaults();
    ControlFlow Flow;
    return Flow.Run(argc, argv);
}
