#include <resource_handlers/aws_handlers.hpp>
#include <memory>

namespace resource_handlers {

void register_builtin_handlers(resource_registry::Registry& registry) {
    registry.add(std::make_shared<VpcHandler>());
    registry.add(std::make_shared<SubnetHandler>());
    registry.add(std::make_shared<SecurityGroupHandler>());
    registry.add(std::make_shared<Ec2InstanceHandler>());
    registry.add(std::make_shared<LambdaFunctionHandler>());
    registry.add(std::make_shared<S3BucketHandler>());
    registry.add(std::make_shared<RdsInstanceHandler>());
}

} // namespace resource_handlers
