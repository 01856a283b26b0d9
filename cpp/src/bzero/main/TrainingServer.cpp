#include "bzero/TrainingServer.hpp"

int main(int ac, char* av[]) { return bzero::TrainingServer::main(ac, av); }
