#include "app.hpp"

int main(int argc, char* argv[]) {
    return HarnessPrepApp{}.run(argc, argv);
}
