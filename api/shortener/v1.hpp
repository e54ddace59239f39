#pragma once

#include "shortener/v1/link.pb.h"

#include "shortener/v1/admin_service.pb.h"
#include "shortener/v1/link_service.pb.h"

#include "shortener/v1/admin_service.grpc.pb.h"
#include "shortener/v1/link_service.grpc.pb.h"
