// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/util/grpc/channel_interface.h"

#include <memory>

#include "clientboot/util/grpc/grpc.h"
#include "grpcpp/client_context.h"

namespace clientboot {

std::unique_ptr<::grpc::ClientContext> DefaultClientContextFactory() {
  auto client_context = std::make_unique<::grpc::ClientContext>();
  ConfigureClientContext(client_context.get());
  return client_context;
}

}  // namespace clientboot
