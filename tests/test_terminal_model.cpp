#include "terminal_model.hpp"
#include "test_site.hpp"
#include <gtest/gtest.h>
#include <limits>

TEST(TerminalModelTest, FunctionCodeFollowsRegisterType) {
    EXPECT_EQ(functionCodeFor(RegisterType::Coil), 1);
    EXPECT_EQ(functionCodeFor(RegisterType::DiscreteInput), 2);
    EXPECT_EQ(functionCodeFor(RegisterType::HoldingRegister), 3);
    EXPECT_EQ(functionCodeFor(RegisterType::InputRegister), 4);
}

TEST(TerminalModelTest, EnumSpellingsParseBack) {
    for (auto type : {RegisterType::Coil, RegisterType::DiscreteInput, RegisterType::HoldingRegister,
                      RegisterType::InputRegister}) {
        EXPECT_EQ(parseRegisterType(toString(type)).value(), type);
    }
    EXPECT_EQ(parseEntityKind("Weighbridge").value(), EntityKind::Weighbridge);
    EXPECT_EQ(parseOrderStatus("InProgress").value(), OrderStatus::InProgress);
    EXPECT_FALSE(parseRegisterType("holding").has_value());
    EXPECT_FALSE(parseEntityKind("Tank").has_value());
}

TEST(TerminalModelTest, LivenessColumns) {
    EXPECT_EQ(livenessColumn(EntityKind::StorageTank), "CurrentVolume");
    EXPECT_EQ(livenessColumn(EntityKind::LoadingArm), "FlowRate");
    EXPECT_EQ(livenessColumn(EntityKind::Weighbridge), "CurrentWeight");
    EXPECT_TRUE(isMappableColumn(EntityKind::StorageTank, "CurrentTemperature"));
    EXPECT_FALSE(isMappableColumn(EntityKind::Weighbridge, "CurrentVolume"));
}

TEST(TerminalModelTest, ConnectionParamsValidation) {
    ConnectionParams params;
    std::string reason;
    EXPECT_TRUE(validateConnectionParams(params, reason));

    params.baudrate = 4800;
    EXPECT_FALSE(validateConnectionParams(params, reason));
    EXPECT_NE(reason.find("baudrate"), std::string::npos);

    params = ConnectionParams();
    params.parity = 'X';
    EXPECT_FALSE(validateConnectionParams(params, reason));

    params = ConnectionParams();
    params.stopbits = 3;
    EXPECT_FALSE(validateConnectionParams(params, reason));

    params = ConnectionParams();
    params.bytesize = 6;
    EXPECT_FALSE(validateConnectionParams(params, reason));

    params = ConnectionParams();
    params.timeout = 0.0;
    EXPECT_FALSE(validateConnectionParams(params, reason));
}

TEST(TerminalModelTest, DeviceValidation) {
    std::string reason;
    EXPECT_TRUE(validateDevice(makeDevice(1), reason));
    EXPECT_TRUE(validateDevice(makeDevice(247), reason));
    EXPECT_FALSE(validateDevice(makeDevice(0), reason));
    EXPECT_FALSE(validateDevice(makeDevice(248), reason));

    SlaveDevice unnamed = makeDevice(5);
    unnamed.name.clear();
    EXPECT_FALSE(validateDevice(unnamed, reason));
}

TEST(TerminalModelTest, MappingValidation) {
    std::string reason;
    RegisterMapping mapping = tankVolume(1, 3, 10, 1, 0.1);
    EXPECT_TRUE(validateMapping(mapping, reason));

    RegisterMapping wrong_code = mapping;
    wrong_code.function_code = 4;
    EXPECT_FALSE(validateMapping(wrong_code, reason));

    RegisterMapping wrong_column = mapping;
    wrong_column.column = "CurrentWeight";
    EXPECT_FALSE(validateMapping(wrong_column, reason));

    RegisterMapping bad_register = mapping;
    bad_register.register_address = 70000;
    EXPECT_FALSE(validateMapping(bad_register, reason));

    RegisterMapping bad_scale = mapping;
    bad_scale.scale_factor = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(validateMapping(bad_scale, reason));
}
