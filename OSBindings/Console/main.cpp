//
//  main.cpp
//  Z80Step
//
//  Created by Thomas Harte on 19/10/2026.
//  Copyright © 2026 Thomas Harte. All rights reserved.
//

#include <cstdio>

#include "OSBindings/Console/Runner.hpp"

int main(int argc, char *argv[]) {
	return Z80Step::Console::run_program(argc, argv, stdout, stderr);
}
