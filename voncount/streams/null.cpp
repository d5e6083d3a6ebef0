// Copyright (c) 2009 - Mozy, Inc.

#include "null.h"

namespace Voncount {

NullStream NullStream::s_instance;

}
