#include "cardlab.hpp"

int main(int argc, const char** argv)
{
    return cardlab::run(argc, argv);
}
