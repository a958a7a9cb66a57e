#pragma once
#include "disable_all_warnings.h"

// glad must be included before any other header that pulls in GL.
DISABLE_WARNINGS_PUSH()
#include <glad/glad.h>
DISABLE_WARNINGS_POP()
