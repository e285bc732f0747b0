#include <space/app.hpp>

int main(int argc, char **argv) { return space::App{}.run(argc, argv); }
