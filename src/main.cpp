#include <iostream>
#include <string>

#include <simq/mqtt/client.hpp>

int main(int argc, char* argv[]){

  // Assumes a broker without username and password, localhost:1883 unless given
  simq::mqtt::ClientConfig config;
  config.client_id = "simq_mqtt_client_example";
  config.host = argc > 1 ? argv[1] : "localhost";
  config.port = argc > 2 ? static_cast<uint16_t>(std::stoi(argv[2])) : 0;
  config.keep_alive = 30;
  config.set_last_will("simq_mqtt_test/status", "offline", true, simq::mqtt::QOS_1);

  simq::mqtt::Logger::set_level(simq::mqtt::LogLevel::DEBUG);

  simq::mqtt::MqttClient client{config};

  // handle messages received
  client.set_callback(
    [](const std::string& topic, const std::vector<uint8_t>& payload, bool retained) {
      std::string message(payload.begin(), payload.end());
      std::cout << "on_message topic: " << topic << ", retained: " << retained
        << ", message: " << message << std::endl;
    }
  );

  // delivery reports for QoS 1 publishes and subscriptions
  client.set_callback_status(
    [](uint16_t packet_id, simq::mqtt::DeliveryStatus status) {
      std::cout << "packet " << packet_id << ": " << status << std::endl;
    }
  );

  try {
    bool resumed = client.connect(false);
    std::cout << "Connected, session " << (resumed ? "resumed" : "new") << std::endl;

    client.subscribe("simq_mqtt_test/#", simq::mqtt::QOS_1);
    client.publish("simq_mqtt_test/status", "online", true, simq::mqtt::QOS_1);

    // send some test messages, alternating QoS 0 and 1
    for (int i = 0; i < 5; i++) {
      std::string msg = "Message #" + std::to_string(i);
      client.publish("simq_mqtt_test/data", msg, false, i % 2 ? simq::mqtt::QOS_1 : simq::mqtt::QOS_0);
    }

    // dispatch for a while, pinging at half the keep alive interval
    simq::mqtt::Timer ping_timer;
    simq::mqtt::Timer run_timer;
    while (!run_timer.has_expired(60000)) {
      client.wait_msg();

      if (ping_timer.has_expired(client.keep_alive() * 500ull)) {
        client.ping();
        ping_timer.reset();
      }
    }

    client.disconnect();
  }
  catch (const simq::mqtt::MqttException& e) {
    std::cerr << "MQTT error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
